#include "model-registry.h"

#include "tts-log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr size_t k_max_model_id_length = 128;

std::atomic<uint64_t> g_staging_seq {0};

voice_files files_in(const fs::path & dir, const std::string & model_id) {
    voice_files f;
    f.model_path = (dir / (model_id + ".onnx")).string();
    f.config_path = (dir / (model_id + ".onnx.json")).string();
    return f;
}

bool both_present(const voice_files & f) {
    std::error_code ec;
    return fs::is_regular_file(f.model_path, ec) && fs::is_regular_file(f.config_path, ec);
}

bool dir_is_writable(const std::string & dir) {
    if (dir.empty()) {
        return false;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return false;
    }
    return ::access(dir.c_str(), W_OK) == 0;
}

// Removes the staging directory on every exit path.
struct staging_dir_guard {
    fs::path path;
    ~staging_dir_guard() {
        if (path.empty()) {
            return;
        }
        std::error_code ec;
        fs::remove_all(path, ec);
        if (ec) {
            TTS_LOG_WARN("model-registry: failed to remove %s: %s\n", path.string().c_str(), ec.message().c_str());
        }
    }
};

} // namespace

const char * voice_model_state_to_cstr(voice_model_state state) {
    switch (state) {
        case VOICE_MODEL_UNRESOLVED: return "unresolved";
        case VOICE_MODEL_RESOLVING:  return "resolving";
        case VOICE_MODEL_READY:      return "ready";
        case VOICE_MODEL_FAILED:     return "failed";
    }
    return "unknown";
}

bool model_id_is_valid(const std::string & id) {
    if (id.empty() || id.size() > k_max_model_id_length || id[0] == '.') {
        return false;
    }
    for (char c : id) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                c == '_' || c == '-' || c == '.';
        if (!ok) {
            return false;
        }
    }
    return true;
}

model_registry::model_registry(const model_registry_params & params, synthesis_engine & engine, model_source * source)
    : params_(params), engine_(engine), source_(source) {
    if (params_.max_models < 1) {
        params_.max_models = 1;
    }
}

bool model_registry::is_permitted(const std::string & model_id) const {
    if (!model_id_is_valid(model_id)) {
        return false;
    }
    if (params_.available_models.empty()) {
        return true;
    }
    return std::find(params_.available_models.begin(), params_.available_models.end(), model_id) !=
            params_.available_models.end();
}

bool model_registry::lookup_or_insert(const std::string & model_id, std::shared_ptr<entry> & out, tts_error & err) {
    {
        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        auto it = table_.find(model_id);
        if (it != table_.end()) {
            out = it->second;
            return true;
        }
    }

    std::unique_lock<std::shared_mutex> lock(table_mtx_);
    auto it = table_.find(model_id);
    if (it != table_.end()) {
        out = it->second;
        return true;
    }
    if ((int32_t) table_.size() >= params_.max_models) {
        prune_failed_locked();
    }
    if ((int32_t) table_.size() >= params_.max_models) {
        tts_error_set(err, TTS_ERROR_MODEL_UNAVAILABLE,
                "model limit reached (" + std::to_string(params_.max_models) + "), cannot load " + model_id);
        return false;
    }
    out = std::make_shared<entry>();
    table_.emplace(model_id, out);
    return true;
}

void model_registry::prune_failed_locked() {
    for (auto it = table_.begin(); it != table_.end();) {
        entry & e = *it->second;
        // A caller between lookup and lock still holds a reference; erasing
        // its entry would let a second record for the same id appear.
        if (it->second.use_count() > 1) {
            ++it;
            continue;
        }
        std::unique_lock<std::mutex> lock(e.mtx, std::try_to_lock);
        if (lock.owns_lock() && e.state == VOICE_MODEL_FAILED) {
            it = table_.erase(it);
        } else {
            ++it;
        }
    }
}

bool model_registry::resolve(const std::string & model_id, std::shared_ptr<const voice_model> & out, tts_error & err) {
    if (!is_permitted(model_id)) {
        tts_error_set(err, TTS_ERROR_MODEL_UNAVAILABLE, "model not available: " + model_id, true);
        return false;
    }

    std::shared_ptr<entry> e;
    if (!lookup_or_insert(model_id, e, err)) {
        return false;
    }

    std::unique_lock<std::mutex> lock(e->mtx);
    if (e->state == VOICE_MODEL_READY) {
        out = e->model;
        return true;
    }

    if (e->state == VOICE_MODEL_RESOLVING) {
        const uint64_t gen = e->generation;
        e->cv.wait(lock, [&]() { return e->generation != gen; });
        if (e->model) {
            out = e->model;
            return true;
        }
        err = e->last_error;
        return false;
    }

    // UNRESOLVED, or FAILED and being retried.
    e->state = VOICE_MODEL_RESOLVING;
    lock.unlock();

    std::shared_ptr<const voice_model> model;
    tts_error acquire_err;
    bool ok = false;

    auto publish = [&]() {
        std::lock_guard<std::mutex> elock(e->mtx);
        if (ok) {
            e->model = model;
            e->last_error = tts_error();
            e->state = VOICE_MODEL_READY;
        } else {
            e->last_error = acquire_err;
            e->state = VOICE_MODEL_FAILED;
        }
        e->generation++;
    };

    try {
        ok = acquire(model_id, model, acquire_err);
    } catch (const std::exception & ex) {
        tts_error_set(acquire_err, TTS_ERROR_MODEL_UNAVAILABLE, "failed to acquire " + model_id + ": " + ex.what());
        ok = false;
    } catch (...) {
        // Waiters must still be released before the exception leaves.
        tts_error_set(acquire_err, TTS_ERROR_MODEL_UNAVAILABLE, "failed to acquire " + model_id);
        ok = false;
        publish();
        e->cv.notify_all();
        throw;
    }
    publish();
    e->cv.notify_all();

    if (!ok) {
        TTS_LOG_WARN("model-registry: %s failed: %s\n", model_id.c_str(), acquire_err.message.c_str());
        err = acquire_err;
        return false;
    }
    out = model;
    return true;
}

bool model_registry::acquire(const std::string & model_id, std::shared_ptr<const voice_model> & out, tts_error & err) {
    const auto t0 = std::chrono::steady_clock::now();

    voice_files files;
    if (!find_local(model_id, files)) {
        if (!fetch_remote(model_id, files, err)) {
            return false;
        }
    }

    std::shared_ptr<const voice_handle> handle;
    int32_t native_rate = 0;
    std::string load_err;
    if (!engine_.load_voice(files, handle, native_rate, load_err)) {
        tts_error_set(err, TTS_ERROR_MODEL_UNAVAILABLE, "failed to load " + model_id + ": " + load_err);
        return false;
    }
    if (native_rate <= 0 || !handle) {
        tts_error_set(err, TTS_ERROR_MODEL_UNAVAILABLE, "engine returned an unusable voice for " + model_id);
        return false;
    }

    auto model = std::make_shared<voice_model>();
    model->id = model_id;
    model->native_sample_rate = native_rate;
    model->handle = handle;
    out = model;

    const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    TTS_LOG_INFO("model-registry: %s ready (native_rate=%d) in %.2f ms\n", model_id.c_str(), native_rate, ms);
    return true;
}

bool model_registry::find_local(const std::string & model_id, voice_files & out) const {
    for (const std::string & dir : {params_.models_dir, params_.fallback_dir}) {
        if (dir.empty()) {
            continue;
        }
        voice_files f = files_in(dir, model_id);
        if (both_present(f)) {
            TTS_LOG_DEBUG("model-registry: %s found in %s\n", model_id.c_str(), dir.c_str());
            out = f;
            return true;
        }
    }
    return false;
}

std::string model_registry::writable_dir() const {
    if (dir_is_writable(params_.models_dir)) {
        return params_.models_dir;
    }
    if (dir_is_writable(params_.fallback_dir)) {
        return params_.fallback_dir;
    }
    return std::string();
}

bool model_registry::fetch_remote(const std::string & model_id, voice_files & out, tts_error & err) {
    if (source_ == nullptr) {
        tts_error_set(err, TTS_ERROR_MODEL_UNAVAILABLE, "model not found locally: " + model_id, true);
        return false;
    }

    const std::string dest = writable_dir();
    if (dest.empty()) {
        tts_error_set(err, TTS_ERROR_MODEL_UNAVAILABLE, "no writable directory to download " + model_id);
        return false;
    }

    const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    staging_dir_guard staging;
    staging.path = fs::path(dest) / ".staging" /
            (model_id + "-" + std::to_string(stamp) + "-" + std::to_string(g_staging_seq.fetch_add(1)));

    std::error_code ec;
    fs::create_directories(staging.path, ec);
    if (ec) {
        tts_error_set(err, TTS_ERROR_MODEL_UNAVAILABLE, "failed to create staging dir: " + ec.message());
        return false;
    }

    voice_files staged;
    std::string fetch_err;
    const model_fetch_status st = source_->fetch(model_id, staging.path.string(), staged, fetch_err);
    if (st != MODEL_FETCH_OK) {
        tts_error_set(err, TTS_ERROR_MODEL_UNAVAILABLE,
                "failed to fetch " + model_id + ": " + fetch_err, st == MODEL_FETCH_NOT_FOUND);
        return false;
    }

    // Presence requires both files, so the voice is only visible after the second rename.
    const voice_files final_files = files_in(dest, model_id);
    fs::rename(staged.config_path, final_files.config_path, ec);
    if (!ec) {
        fs::rename(staged.model_path, final_files.model_path, ec);
    }
    if (ec) {
        tts_error_set(err, TTS_ERROR_MODEL_UNAVAILABLE, "failed to publish " + model_id + ": " + ec.message());
        return false;
    }

    out = final_files;
    return true;
}

voice_model_state model_registry::state(const std::string & model_id) const {
    std::shared_ptr<entry> e;
    {
        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        auto it = table_.find(model_id);
        if (it == table_.end()) {
            return VOICE_MODEL_UNRESOLVED;
        }
        e = it->second;
    }
    std::lock_guard<std::mutex> lock(e->mtx);
    return e->state;
}

std::vector<voice_model_info> model_registry::snapshot() const {
    std::vector<voice_model_info> out;
    std::shared_lock<std::shared_mutex> lock(table_mtx_);
    out.reserve(table_.size());
    for (const auto & kv : table_) {
        std::lock_guard<std::mutex> entry_lock(kv.second->mtx);
        voice_model_info info;
        info.id = kv.first;
        info.state = kv.second->state;
        info.native_sample_rate = kv.second->model ? kv.second->model->native_sample_rate : 0;
        info.last_error = kv.second->state == VOICE_MODEL_FAILED ? kv.second->last_error.message : std::string();
        out.push_back(info);
    }
    return out;
}

size_t model_registry::preload(const std::vector<std::string> & ids) {
    size_t n_ready = 0;
    for (const std::string & id : ids) {
        std::shared_ptr<const voice_model> model;
        tts_error err;
        if (resolve(id, model, err)) {
            ++n_ready;
        } else {
            TTS_LOG_WARN("preload: %s: %s\n", id.c_str(), err.message.c_str());
        }
    }
    return n_ready;
}
