#include "model-source.h"

#include "tts-log.h"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>

bool parse_http_url(const std::string & raw, parsed_http_url & out, std::string & err) {
    static const std::regex re(R"(^(https?)://([^/:?#]+)(?::([0-9]+))?([^?#]*)?(\?[^#]*)?$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(raw, m, re)) {
        err = "invalid URL: " + raw;
        return false;
    }

    std::string scheme = m[1].str();
    std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) {
        return (char) std::tolower(c);
    });

    out.https = scheme == "https";
    out.host = m[2].str();
    out.port = out.https ? 443 : 80;
    if (m[3].matched && !m[3].str().empty()) {
        char * end = nullptr;
        const long p = std::strtol(m[3].str().c_str(), &end, 10);
        if (end == nullptr || *end != '\0' || p < 1 || p > 65535) {
            err = "invalid port in URL: " + raw;
            return false;
        }
        out.port = (int32_t) p;
    }
    out.path = m[4].matched ? m[4].str() : "/";
    if (out.path.empty()) {
        out.path = "/";
    }
    if (m[5].matched) {
        out.path += m[5].str();
    }

    return true;
}

bool piper_voice_remote_stem(const std::string & model_id, std::string & out) {
    const size_t first = model_id.find('-');
    const size_t last = model_id.rfind('-');
    if (first == std::string::npos || first == last || first == 0 || last + 1 >= model_id.size()) {
        return false;
    }

    const std::string lang_region = model_id.substr(0, first);
    const std::string name = model_id.substr(first + 1, last - first - 1);
    const std::string quality = model_id.substr(last + 1);

    const size_t us = lang_region.find('_');
    if (us == std::string::npos || us == 0 || name.empty()) {
        return false;
    }
    const std::string lang = lang_region.substr(0, us);

    out = lang + "/" + lang_region + "/" + name + "/" + quality + "/" + model_id;
    return true;
}

namespace {

template <typename Client>
httplib::Result get_to_file(
        Client & cli,
        int32_t timeout_sec,
        const std::string & path,
        std::ofstream & file,
        int & status) {
    cli.set_follow_location(true);
    cli.set_connection_timeout(timeout_sec, 0);
    cli.set_read_timeout(timeout_sec, 0);
    cli.set_write_timeout(timeout_sec, 0);
    return cli.Get(path.c_str(),
            [&](const httplib::Response & res) {
                status = res.status;
                return res.status >= 200 && res.status < 300;
            },
            [&](const char * data, size_t len) {
                file.write(data, (std::streamsize) len);
                return (bool) file;
            });
}

} // namespace

http_model_source::http_model_source(const http_model_source_params & params)
    : params_(params) {
    while (!params_.base_url.empty() && params_.base_url.back() == '/') {
        params_.base_url.pop_back();
    }
}

model_fetch_status http_model_source::download(const std::string & remote_path, const std::string & local_path, std::string & err) {
    parsed_http_url url;
    if (!parse_http_url(params_.base_url + "/" + remote_path, url, err)) {
        return MODEL_FETCH_FAILED;
    }

    std::ofstream file(local_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        err = "failed to open " + local_path + " for writing";
        return MODEL_FETCH_FAILED;
    }

    int status = 0;
    httplib::Result res;
    if (url.https) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        httplib::SSLClient cli(url.host, url.port);
        res = get_to_file(cli, params_.timeout_sec, url.path, file, status);
#else
        err = "https URL requires CPPHTTPLIB_OPENSSL_SUPPORT";
        return MODEL_FETCH_FAILED;
#endif
    } else {
        httplib::Client cli(url.host, url.port);
        res = get_to_file(cli, params_.timeout_sec, url.path, file, status);
    }
    file.close();

    if (status == 404) {
        err = "not found at model source: " + remote_path;
        return MODEL_FETCH_NOT_FOUND;
    }
    if (status != 0 && (status < 200 || status >= 300)) {
        err = "model source HTTP " + std::to_string(status) + " for " + remote_path;
        return MODEL_FETCH_FAILED;
    }
    if (!res) {
        err = "download of " + remote_path + " failed: " + httplib::to_string(res.error());
        return MODEL_FETCH_FAILED;
    }
    if (!file) {
        err = "failed writing " + local_path;
        return MODEL_FETCH_FAILED;
    }
    return MODEL_FETCH_OK;
}

model_fetch_status http_model_source::fetch(
        const std::string & model_id,
        const std::string & staging_dir,
        voice_files & out,
        std::string & err) {
    std::string stem;
    if (!piper_voice_remote_stem(model_id, stem)) {
        err = "model id does not name a voice in the repository: " + model_id;
        return MODEL_FETCH_NOT_FOUND;
    }

    const std::filesystem::path dir(staging_dir);
    const std::string model_path = (dir / (model_id + ".onnx")).string();
    const std::string config_path = (dir / (model_id + ".onnx.json")).string();

    const auto t0 = std::chrono::steady_clock::now();
    TTS_LOG_INFO("model-source: fetching %s from %s\n", model_id.c_str(), params_.base_url.c_str());

    model_fetch_status st = download(stem + ".onnx.json", config_path, err);
    if (st != MODEL_FETCH_OK) {
        return st;
    }
    st = download(stem + ".onnx", model_path, err);
    if (st != MODEL_FETCH_OK) {
        return st;
    }

    std::error_code ec;
    const uintmax_t bytes = std::filesystem::file_size(model_path, ec);
    const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    TTS_LOG_INFO("model-source: fetched %s (%ju bytes) in %.2f ms\n", model_id.c_str(), ec ? (uintmax_t) 0 : bytes, ms);

    out.model_path = model_path;
    out.config_path = config_path;
    return MODEL_FETCH_OK;
}
