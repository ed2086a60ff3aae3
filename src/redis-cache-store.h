#pragma once

#include "cache-store.h"
#include "redis-resp.h"

#include <mutex>
#include <string>
#include <vector>

struct redis_params {
    std::string host = "localhost";
    int32_t port = 6379;
    std::string password;
    int32_t db = 0;
    int32_t timeout_ms = 500;           // connect, read and write bound
    int32_t max_idle_connections = 4;
};

// Redis adapter speaking RESP2 over plain TCP. Connections are opened lazily
// and kept in a small idle pool; any I/O or protocol error closes the
// connection involved and surfaces as a failed call.
class redis_cache_store : public cache_store {
public:
    explicit redis_cache_store(const redis_params & params);
    ~redis_cache_store() override;

    redis_cache_store(const redis_cache_store &) = delete;
    redis_cache_store & operator=(const redis_cache_store &) = delete;

    bool get(const std::string & key, std::vector<uint8_t> & value, bool & found, std::string & err) override;
    bool set(const std::string & key, const std::vector<uint8_t> & value, int32_t ttl_sec, std::string & err) override;
    const char * name() const override { return "redis"; }

    bool ping(std::string & err);

    const redis_params & params() const { return params_; }

private:
    bool execute(const std::vector<std::string> & args, resp_reply & reply, std::string & err);
    bool checkout(int & fd, std::string & err);
    void checkin(int fd);
    bool connect_new(int & fd, std::string & err);
    bool command(int fd, const std::vector<std::string> & args, resp_reply & reply, std::string & err);

    redis_params params_;
    std::mutex pool_mtx_;
    std::vector<int> idle_;
};
