// src/env_store.cpp
#include "env_store.h"
#include "otp_errors.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <sstream>
#include <utility>

extern char** environ;

using json = nlohmann::json;

namespace {

std::string trim_copy(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower_copy(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string unquote(const std::string& v) {
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

} // namespace

EnvStore::EnvStore(std::unordered_map<std::string, std::string> values)
    : map_(std::move(values)) {}

EnvStore EnvStore::from_process_env() {
    std::unordered_map<std::string, std::string> values;
    for (char** e = environ; e && *e; ++e) {
        const std::string kv(*e);
        const auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        values.emplace(kv.substr(0, eq), kv.substr(eq + 1));
    }
    return EnvStore(std::move(values));
}

void EnvStore::load_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("Env file not found: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw ConfigurationError("Env file " + path + " is not valid JSON: " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigurationError("Env file " + path + " must contain a JSON object");
    }

    std::unordered_map<std::string, std::string> parsed;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& v = it.value();
        if (v.is_string())       parsed[it.key()] = v.get<std::string>();
        else if (v.is_boolean()) parsed[it.key()] = v.get<bool>() ? "true" : "false";
        else if (v.is_number())  parsed[it.key()] = v.dump();
        else if (v.is_null())    parsed[it.key()] = "";
        else throw ConfigurationError("Env file " + path + ": value of " + it.key() + " must be a scalar");
    }

    std::unique_lock<std::shared_mutex> lk(mu_);
    for (auto& kv : parsed) map_[kv.first] = std::move(kv.second);
}

void EnvStore::load_dotenv_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("Env file not found: " + path);
    }

    std::unordered_map<std::string, std::string> parsed;
    std::string line;
    while (std::getline(in, line)) {
        std::string l = trim_copy(line);
        if (l.empty() || l.front() == '#') continue;
        if (l.rfind("export ", 0) == 0) l = trim_copy(l.substr(7));

        const auto eq = l.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim_copy(l.substr(0, eq));
        if (key.empty()) continue;
        parsed.emplace(std::move(key), unquote(trim_copy(l.substr(eq + 1))));
    }

    std::unique_lock<std::shared_mutex> lk(mu_);
    for (auto& kv : parsed) map_.emplace(kv.first, std::move(kv.second));
}

void EnvStore::set(const std::string& key, const std::string& value) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    map_[key] = value;
}

void EnvStore::erase(const std::string& key) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    map_.erase(key);
}

bool EnvStore::has(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = map_.find(key);
    return it != map_.end() && !it->second.empty();
}

std::optional<std::string> EnvStore::lookup(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;
    return it->second;
}

std::size_t EnvStore::size() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return map_.size();
}

void EnvStore::require(const std::vector<std::string>& keys) const {
    std::string missing;
    for (const auto& k : keys) {
        if (has(k)) continue;
        if (!missing.empty()) missing += ", ";
        missing += k;
    }
    if (!missing.empty()) {
        throw ConfigurationError("Missing required env var(s): " + missing);
    }
}

std::optional<std::string> EnvStore::fetch(const std::string& key, bool required, bool trim) const {
    std::optional<std::string> raw = lookup(key);
    if (raw && trim) raw = trim_copy(*raw);
    if (!raw || raw->empty()) {
        if (required) throw ConfigurationError("Missing environment variable: " + key);
        return std::nullopt;
    }
    return raw;
}

// ---- typed accessors ---------------------------------------------------------

std::string EnvStore::get_string(const std::string& key, const EnvOpts<std::string>& opts) const {
    auto raw = fetch(key, opts.required, opts.trim);
    if (!raw) return opts.def.value_or(std::string());
    return *raw;
}

double EnvStore::get_number(const std::string& key, const EnvOpts<double>& opts) const {
    auto raw = fetch(key, opts.required, opts.trim);
    if (!raw) return opts.def.value_or(0.0);
    try {
        std::size_t used = 0;
        const double v = std::stod(*raw, &used);
        if (used == raw->size()) return v;
    } catch (const std::exception&) {
        // fall through to the error below
    }
    throw ConfigurationError("Environment variable " + key + " is not a valid number: \"" + *raw + "\"");
}

long long EnvStore::get_int(const std::string& key, const EnvOpts<long long>& opts) const {
    auto raw = fetch(key, opts.required, opts.trim);
    if (!raw) return opts.def.value_or(0);
    try {
        std::size_t used = 0;
        const long long v = std::stoll(*raw, &used, 10);
        if (used == raw->size()) return v;
    } catch (const std::exception&) {
        // fall through to the error below
    }
    throw ConfigurationError("Environment variable " + key + " is not a valid integer: \"" + *raw + "\"");
}

bool EnvStore::get_bool(const std::string& key, const EnvOpts<bool>& opts) const {
    auto raw = fetch(key, opts.required, opts.trim);
    if (!raw) return opts.def.value_or(false);
    const std::string v = lower_copy(*raw);
    if (v == "true" || v == "1" || v == "yes" || v == "on")  return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw ConfigurationError("Environment variable " + key + " is not a valid boolean: \"" + *raw + "\"");
}

std::string EnvStore::get_enum(const std::string& key,
                               const std::vector<std::string>& allowed,
                               const EnvOpts<std::string>& opts) const {
    auto raw = fetch(key, opts.required, opts.trim);
    if (!raw) return opts.def.value_or(std::string());
    if (std::find(allowed.begin(), allowed.end(), *raw) != allowed.end()) return *raw;

    std::ostringstream oss;
    oss << "Environment variable " << key << " must be one of [";
    for (std::size_t i = 0; i < allowed.size(); ++i) {
        if (i) oss << ", ";
        oss << allowed[i];
    }
    oss << "], got \"" << *raw << "\"";
    throw ConfigurationError(oss.str());
}

std::vector<std::string> EnvStore::get_list(const std::string& key,
                                            char sep,
                                            const EnvOpts<std::vector<std::string>>& opts) const {
    auto raw = fetch(key, opts.required, opts.trim);
    if (!raw) return opts.def.value_or(std::vector<std::string>{});

    std::vector<std::string> out;
    std::string item;
    std::istringstream ss(*raw);
    while (std::getline(ss, item, sep)) {
        item = trim_copy(item);
        if (!item.empty()) out.push_back(std::move(item));
    }
    return out;
}

json EnvStore::get_json(const std::string& key, const EnvOpts<json>& opts) const {
    auto raw = fetch(key, opts.required, opts.trim);
    if (!raw) return opts.def.value_or(json());
    try {
        return json::parse(*raw);
    } catch (const json::exception& e) {
        throw ConfigurationError("Environment variable " + key + " is not valid JSON: " + e.what());
    }
}
