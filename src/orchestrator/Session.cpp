/**
 * Session.cpp - Conversation id creation and backend hand-over
 */

#include "parley/Session.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <utility>

namespace parley {

Session::Session(std::string id)
    : id_(id.empty() ? generateId() : std::move(id))
{
}

void Session::adopt(const std::string& backend_id) {
    if (backend_id.empty() || backend_id == id_) {
        return;
    }
    std::cout << "[Session] Backend switched conversation: " << id_ << " -> " << backend_id << std::endl;
    id_ = backend_id;
}

std::string Session::generateId() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi = rng();
    uint64_t lo = rng();

    // RFC 4122 version 4, variant 1
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream out;
    out << std::hex << std::setfill('0')
        << "session-"
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return out.str();
}

} // namespace parley
