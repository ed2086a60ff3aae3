#include "redis-resp.h"

#include <cerrno>
#include <cstdlib>

static constexpr int64_t k_resp_max_bulk_bytes = 512LL * 1024 * 1024;
static constexpr int k_resp_max_depth = 8;

std::string resp_encode_command(const std::vector<std::string> & args) {
    std::string out;
    size_t total = 16;
    for (const auto & a : args) {
        total += a.size() + 16;
    }
    out.reserve(total);

    out += '*';
    out += std::to_string(args.size());
    out += "\r\n";
    for (const auto & a : args) {
        out += '$';
        out += std::to_string(a.size());
        out += "\r\n";
        out.append(a.data(), a.size());
        out += "\r\n";
    }
    return out;
}

// Finds the CRLF-terminated line starting at `pos`. Returns false when the
// terminator has not arrived yet.
static bool read_line(const char * data, size_t n, size_t pos, std::string & line, size_t & next) {
    for (size_t i = pos; i + 1 < n; ++i) {
        if (data[i] == '\r' && data[i + 1] == '\n') {
            line.assign(data + pos, i - pos);
            next = i + 2;
            return true;
        }
    }
    return false;
}

static bool parse_i64(const std::string & s, int64_t & out) {
    if (s.empty()) {
        return false;
    }
    char * end = nullptr;
    errno = 0;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || errno == ERANGE) {
        return false;
    }
    out = (int64_t) v;
    return true;
}

static resp_parse_status parse_at(
        const char * data,
        size_t n,
        size_t pos,
        int depth,
        size_t & next,
        resp_reply & out,
        std::string & err) {
    if (depth > k_resp_max_depth) {
        err = "RESP nesting too deep";
        return RESP_PARSE_ERROR;
    }
    if (pos >= n) {
        return RESP_PARSE_INCOMPLETE;
    }

    const char tag = data[pos];
    std::string line;
    size_t after_line = 0;
    if (!read_line(data, n, pos + 1, line, after_line)) {
        return RESP_PARSE_INCOMPLETE;
    }

    switch (tag) {
        case '+':
            out = resp_reply();
            out.type = RESP_TYPE_SIMPLE;
            out.str = line;
            next = after_line;
            return RESP_PARSE_OK;
        case '-':
            out = resp_reply();
            out.type = RESP_TYPE_ERROR;
            out.str = line;
            next = after_line;
            return RESP_PARSE_OK;
        case ':': {
            out = resp_reply();
            out.type = RESP_TYPE_INTEGER;
            if (!parse_i64(line, out.integer)) {
                err = "invalid RESP integer: " + line;
                return RESP_PARSE_ERROR;
            }
            next = after_line;
            return RESP_PARSE_OK;
        }
        case '$': {
            int64_t len = 0;
            if (!parse_i64(line, len) || len < -1 || len > k_resp_max_bulk_bytes) {
                err = "invalid RESP bulk length: " + line;
                return RESP_PARSE_ERROR;
            }
            out = resp_reply();
            if (len == -1) {
                out.type = RESP_TYPE_NIL;
                next = after_line;
                return RESP_PARSE_OK;
            }
            const size_t need = after_line + (size_t) len + 2;
            if (need > n) {
                return RESP_PARSE_INCOMPLETE;
            }
            if (data[need - 2] != '\r' || data[need - 1] != '\n') {
                err = "RESP bulk string is not CRLF terminated";
                return RESP_PARSE_ERROR;
            }
            out.type = RESP_TYPE_BULK;
            out.str.assign(data + after_line, (size_t) len);
            next = need;
            return RESP_PARSE_OK;
        }
        case '*': {
            int64_t count = 0;
            if (!parse_i64(line, count) || count < -1) {
                err = "invalid RESP array length: " + line;
                return RESP_PARSE_ERROR;
            }
            out = resp_reply();
            if (count == -1) {
                out.type = RESP_TYPE_NIL;
                next = after_line;
                return RESP_PARSE_OK;
            }
            out.type = RESP_TYPE_ARRAY;
            size_t cur = after_line;
            for (int64_t i = 0; i < count; ++i) {
                resp_reply elem;
                size_t elem_next = 0;
                const resp_parse_status st = parse_at(data, n, cur, depth + 1, elem_next, elem, err);
                if (st != RESP_PARSE_OK) {
                    return st;
                }
                out.elements.push_back(std::move(elem));
                cur = elem_next;
            }
            next = cur;
            return RESP_PARSE_OK;
        }
        default:
            err = "unexpected RESP type byte: " + std::to_string((int) (unsigned char) tag);
            return RESP_PARSE_ERROR;
    }
}

resp_parse_status resp_parse(const char * data, size_t n, size_t & consumed, resp_reply & out, std::string & err) {
    size_t next = 0;
    const resp_parse_status st = parse_at(data, n, 0, 0, next, out, err);
    if (st == RESP_PARSE_OK) {
        consumed = next;
    }
    return st;
}
