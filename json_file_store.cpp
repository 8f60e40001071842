#include "json_file_store.hpp"

#include "uptimeping_event.hpp"
#include "uptimeping_metrics.hpp"
#include "str.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace {
std::mutex &json_file_store_mutex() {
    static std::mutex mutex;
    return mutex;
}
} // namespace

bool json_file_save(std::filesystem::path const &path, std::string const &contents) {
    try {
        std::lock_guard _{json_file_store_mutex()};
        std::ofstream o{path, std::ios::out | std::ios::binary | std::ios::trunc};
        if (!o) { throw std::runtime_error("cannot open for writing"); }
        o << contents;
        o.flush();
        if (!o) { throw std::runtime_error("write failed"); }
        return true;
    } catch (std::exception const &e) {
        ++uptimeping_metric().persistence_write_failures;
        uptimeping_event_log("json_file_save_failed", str(path.string(), ": ", e.what()));
        return false;
    }
}

Json::Value json_file_load(std::filesystem::path const &path, Json::Value default_value) {
    std::string contents;
    {
        std::lock_guard _{json_file_store_mutex()};
        std::ifstream i{path, std::ios::in | std::ios::binary};
        if (!i) { return default_value; }
        std::ostringstream current;
        current << i.rdbuf();
        if (i.bad()) {
            ++uptimeping_metric().persistence_read_failures;
            std::cerr << "json_file_load cannot read " << path << std::endl;
            return default_value;
        }
        contents = current.str();
    }

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
    Json::Value root;
    std::string errors;
    if (!reader->parse(contents.data(), contents.data() + contents.size(), &root, &errors)) {
        ++uptimeping_metric().persistence_read_failures;
        uptimeping_event_log("json_file_load_malformed", str(path.string(), ": ", str_trim(errors)));
        return default_value;
    }
    return root;
}
