#include "server/sessionRegistry.hpp"

#include "fakeTransport.hpp"

#include <gtest/gtest.h>

#include <set>

namespace ttt::gtest {

using server::Seat;
using server::SessionRegistry;

TEST(SessionRegistry, SeatsByAdmissionOrder) {
	SessionRegistry registry(10);
	EXPECT_TRUE(registry.admit(5));
	EXPECT_TRUE(registry.admit(6));
	EXPECT_TRUE(registry.admit(7));

	EXPECT_EQ(registry.getSeat(5), Seat::PlayerOne);
	EXPECT_EQ(registry.getSeat(6), Seat::PlayerTwo);
	EXPECT_EQ(registry.getSeat(7), Seat::Observer);
	EXPECT_FALSE(registry.getSeat(8).has_value());
	EXPECT_EQ(registry.size(), 3u);
}

TEST(SessionRegistry, DuplicateAndCapacity) {
	SessionRegistry registry(2);
	EXPECT_EQ(registry.capacity(), 2u);
	EXPECT_TRUE(registry.admit(1));
	EXPECT_FALSE(registry.admit(1));
	EXPECT_TRUE(registry.admit(2));
	EXPECT_FALSE(registry.admit(3));
	EXPECT_EQ(registry.size(), 2u);
	EXPECT_FALSE(registry.contains(3));
}

TEST(SessionRegistry, PruneRemovesDeadSessions) {
	FakeTransport transport;
	SessionRegistry registry(10);

	const auto a = transport.connect();
	const auto b = transport.connect();
	const auto c = transport.connect();
	const auto d = transport.connect();
	for (const auto id: {a, b, c, d}) {
		ASSERT_TRUE(registry.admit(id));
	}

	transport.invalidate(a);
	transport.invalidate(c);
	EXPECT_EQ(registry.prune(transport), 2u);
	EXPECT_EQ(registry.prune(transport), 0u);

	std::set<network::ConnectionId> remaining;
	registry.forEachSession([&](const server::SessionContext& session) { remaining.insert(session.connectionId); });
	EXPECT_EQ(remaining, (std::set<network::ConnectionId>{b, d}));
}

TEST(SessionRegistry, FreedSeatIsReassigned) {
	FakeTransport transport;
	SessionRegistry registry(10);

	const auto a = transport.connect();
	const auto b = transport.connect();
	const auto c = transport.connect();
	registry.admit(a);
	registry.admit(b);
	registry.admit(c);

	transport.invalidate(a);
	registry.prune(transport);

	// Observer keeps its seat, the next admitted connection takes the free one.
	EXPECT_EQ(registry.getSeat(c), Seat::Observer);
	const auto d = transport.connect();
	registry.admit(d);
	EXPECT_EQ(registry.getSeat(d), Seat::PlayerOne);
}

TEST(SessionRegistry, BroadcastSkipsFailures) {
	FakeTransport transport;
	SessionRegistry registry(10);

	const auto a = transport.connect();
	const auto b = transport.connect();
	const auto c = transport.connect();
	registry.admit(a);
	registry.admit(b);
	registry.admit(c);

	transport.invalidate(b);
	transport.failSendsTo(c);

	EXPECT_EQ(registry.broadcast(transport, network::encodeFrame("DRAW")), 1u);
	EXPECT_EQ(transport.takeSent(a), std::vector<std::string>{"DRAW"});
	EXPECT_TRUE(transport.takeSent(b).empty());
	EXPECT_TRUE(transport.takeSent(c).empty());
}

TEST(SessionRegistry, SeatHelpers) {
	EXPECT_TRUE(server::isPlayer(Seat::PlayerOne));
	EXPECT_TRUE(server::isPlayer(Seat::PlayerTwo));
	EXPECT_FALSE(server::isPlayer(Seat::Observer));
	EXPECT_EQ(server::toPlayer(Seat::PlayerOne), Player::One);
	EXPECT_EQ(server::toPlayer(Seat::PlayerTwo), Player::Two);
}

} // namespace ttt::gtest
