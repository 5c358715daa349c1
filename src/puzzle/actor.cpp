/// @file actor.cpp
/// @brief Actor identity

#include <stockroom/puzzle/actor.hpp>

#include <atomic>

namespace stock_puzzle {

namespace {
std::atomic<std::uint64_t> s_next_actor_id{1};
}

Actor::Actor()
    : m_id{s_next_actor_id.fetch_add(1, std::memory_order_relaxed)} {}

} // namespace stock_puzzle
