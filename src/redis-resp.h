#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Minimal RESP2 codec: enough for GET/SETEX/AUTH/SELECT/PING.

enum resp_type {
    RESP_TYPE_SIMPLE = 0,
    RESP_TYPE_ERROR,
    RESP_TYPE_INTEGER,
    RESP_TYPE_BULK,
    RESP_TYPE_NIL,
    RESP_TYPE_ARRAY,
};

struct resp_reply {
    resp_type type = RESP_TYPE_NIL;
    std::string str;     // simple, error and bulk payloads (binary safe)
    int64_t integer = 0;
    std::vector<resp_reply> elements;
};

enum resp_parse_status {
    RESP_PARSE_OK = 0,
    RESP_PARSE_INCOMPLETE,
    RESP_PARSE_ERROR,
};

std::string resp_encode_command(const std::vector<std::string> & args);

// Parse one reply from the front of `data`. On RESP_PARSE_OK `consumed` holds
// the number of bytes the reply occupied.
resp_parse_status resp_parse(const char * data, size_t n, size_t & consumed, resp_reply & out, std::string & err);
