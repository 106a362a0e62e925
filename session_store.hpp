#ifndef SESSION_STORE_HPP
#define SESSION_STORE_HPP

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

// Session table of one endpoint, keyed by session id with a secondary index
// by socket fd. Only the endpoint's event loop touches it, hence no mutex.
template <typename Entry>
class SessionStore
{
private:
    std::unordered_map<uint32_t, std::unique_ptr<Entry>> sessions;
    std::unordered_map<int, uint32_t> fd_to_session_id;

public:
    Entry *insert(uint32_t session_id, std::unique_ptr<Entry> entry)
    {
        Entry *raw = entry.get();
        sessions[session_id] = std::move(entry);
        return raw;
    }

    void bind_fd(int fd, uint32_t session_id) { fd_to_session_id[fd] = session_id; }
    void unbind_fd(int fd) { fd_to_session_id.erase(fd); }

    Entry *find(uint32_t session_id)
    {
        auto it = sessions.find(session_id);
        return it == sessions.end() ? nullptr : it->second.get();
    }

    Entry *find_by_fd(int fd)
    {
        auto it = fd_to_session_id.find(fd);
        return it == fd_to_session_id.end() ? nullptr : find(it->second);
    }

    bool contains(uint32_t session_id) const { return sessions.count(session_id) > 0; }

    // Hands the entry back so it outlives any callback still on the stack.
    std::unique_ptr<Entry> remove(uint32_t session_id)
    {
        auto it = sessions.find(session_id);
        if (it == sessions.end())
            return nullptr;
        std::unique_ptr<Entry> entry = std::move(it->second);
        sessions.erase(it);
        return entry;
    }

    std::vector<uint32_t> ids() const
    {
        std::vector<uint32_t> result;
        result.reserve(sessions.size());
        for (const auto &item : sessions)
        {
            result.push_back(item.first);
        }
        return result;
    }

    size_t size() const { return sessions.size(); }
};

#endif
