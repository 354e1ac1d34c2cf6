#pragma once

#include "network/remote_api.hpp"
#include <deque>
#include <functional>
#include <map>
#include <utility>

namespace larder::testing {

/**
 * ScriptedRemote - In-process backend with optimistic concurrency and
 * operation-id idempotency. Failures are scripted per call.
 */
class ScriptedRemote : public network::RemoteApi {
public:
    struct Stored {
        Fields fields;
        int64_t version{0};
        Timestamp updated_at;
    };

    using Key = std::pair<EntityType, std::string>;

    std::map<Key, Stored> records;
    std::vector<network::MutationRequest> sent;
    std::deque<Error> send_failures;        // consumed one per send
    std::optional<Error> always_fail;       // every send fails with this
    std::optional<Error> fetch_failure;
    std::function<void()> on_send;          // runs inside send(), before the reply
    int fetch_calls = 0;
    Timestamp clock{1'700'000'000'000};

    void set(EntityType type, const std::string& id, Fields fields, int64_t version,
             Timestamp updated_at = Timestamp{}) {
        records[{type, id}] = Stored{std::move(fields), version,
                                     updated_at.millis() ? updated_at : clock};
    }

    [[nodiscard]] const Stored* find(EntityType type, const std::string& id) const {
        auto it = records.find({type, id});
        return it == records.end() ? nullptr : &it->second;
    }

    [[nodiscard]] int sends_for(const std::string& id) const {
        int n = 0;
        for (const auto& r : sent) {
            if (r.entity_id == id) n++;
        }
        return n;
    }

    Result<int64_t, Error> send(const network::MutationRequest& request) override {
        using R = Result<int64_t, Error>;
        sent.push_back(request);
        if (on_send) on_send();
        if (always_fail) return R::err(*always_fail);
        if (!send_failures.empty()) {
            auto error = send_failures.front();
            send_failures.pop_front();
            return R::err(error);
        }
        const auto op = request.operation_id.to_string();
        if (auto it = applied_.find(op); it != applied_.end()) {
            return R::ok(it->second);
        }

        const Key key{request.entity_type, request.entity_id};
        auto it = records.find(key);
        int64_t version = 0;
        switch (request.operation) {
            case Operation::Create:
                if (it != records.end()) return conflict();
                records[key] = Stored{request.payload, 1, clock};
                version = 1;
                break;
            case Operation::Update:
                if (it == records.end() || it->second.version != request.base_version) return conflict();
                it->second.fields = overlay(it->second.fields, request.payload);
                it->second.version += 1;
                it->second.updated_at = clock;
                version = it->second.version;
                break;
            case Operation::Delete:
                if (it == records.end()) {
                    version = request.base_version;
                    break;
                }
                if (it->second.version != request.base_version) return conflict();
                version = it->second.version + 1;
                records.erase(it);
                break;
        }
        applied_[op] = version;
        return R::ok(version);
    }

    Result<std::optional<network::RemoteRecord>, Error> fetch(EntityType type,
                                                             const std::string& id) override {
        using R = Result<std::optional<network::RemoteRecord>, Error>;
        fetch_calls++;
        if (fetch_failure) return R::err(*fetch_failure);
        const auto* stored = find(type, id);
        if (!stored) return R::ok(std::nullopt);
        return R::ok(network::RemoteRecord{type, id, stored->fields, stored->version, stored->updated_at});
    }

    Result<std::vector<network::RemoteRecord>, Error> list(EntityType type) override {
        using R = Result<std::vector<network::RemoteRecord>, Error>;
        if (always_fail) return R::err(*always_fail);
        std::vector<network::RemoteRecord> out;
        for (const auto& [key, stored] : records) {
            if (key.first == type) {
                out.push_back(network::RemoteRecord{type, key.second, stored.fields, stored.version,
                                                    stored.updated_at});
            }
        }
        return R::ok(std::move(out));
    }

private:
    static Result<int64_t, Error> conflict() {
        return Result<int64_t, Error>::err(Error::of(ErrorKind::VersionConflict, "stale base version", 409));
    }

    std::map<std::string, int64_t> applied_;
};

inline Error network_down() {
    return Error::of(ErrorKind::NetworkError, "connection refused");
}

} // namespace larder::testing
