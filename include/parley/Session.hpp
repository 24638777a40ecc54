/**
 * Session.hpp - Conversation identifier shared by every backend call of a wake cycle
 */

#pragma once

#include <string>

namespace parley {

class Session {
public:
    /// Empty id -> a fresh random "session-<uuid>" id.
    explicit Session(std::string id = {});

    const std::string& id() const { return id_; }

    /// Replace the id with one supplied by the backend. Empty ids are ignored.
    void adopt(const std::string& backend_id);

    static std::string generateId();

private:
    std::string id_;
};

} // namespace parley
