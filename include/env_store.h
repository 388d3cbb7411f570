// include/env_store.h
#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Per-accessor retrieval options.
//  required: missing/empty value throws ConfigurationError (default)
//  def:      returned when !required and the value is missing/empty
//            (the type's empty value if unset)
//  trim:     strip surrounding whitespace before use (default)
template<typename T>
struct EnvOpts {
    bool required = true;
    std::optional<T> def{};
    bool trim = true;
};

// Thread-safe key -> string store standing in for the process environment.
// Reads take a shared lock, writes a unique lock.
class EnvStore {
public:
    EnvStore() = default;
    explicit EnvStore(std::unordered_map<std::string, std::string> values);

    EnvStore(const EnvStore&) = delete;
    EnvStore& operator=(const EnvStore&) = delete;

    // Snapshot of environ at call time; later setenv() calls are not seen.
    static EnvStore from_process_env();

    // Flat JSON object; strings, numbers and booleans are stored as text.
    // Overwrites existing keys. Throws ConfigurationError on I/O or shape errors.
    void load_json_file(const std::string& path);

    // KEY=VALUE lines, '#' comments, optional "export " and quotes.
    // Existing keys win (dotenv semantics). Throws ConfigurationError on I/O errors.
    void load_dotenv_file(const std::string& path);

    void set(const std::string& key, const std::string& value);
    void erase(const std::string& key);

    // present and non-empty
    bool has(const std::string& key) const;
    std::optional<std::string> lookup(const std::string& key) const;
    std::size_t size() const;

    // Throws ConfigurationError listing every key that is missing or empty.
    void require(const std::vector<std::string>& keys) const;

    // Typed accessors
    std::string get_string(const std::string& key, const EnvOpts<std::string>& opts = {}) const;
    double get_number(const std::string& key, const EnvOpts<double>& opts = {}) const;
    long long get_int(const std::string& key, const EnvOpts<long long>& opts = {}) const;
    // true/1/yes/on, false/0/no/off (case-insensitive)
    bool get_bool(const std::string& key, const EnvOpts<bool>& opts = {}) const;
    std::string get_enum(const std::string& key,
                         const std::vector<std::string>& allowed,
                         const EnvOpts<std::string>& opts = {}) const;
    // split on sep, items trimmed, empty items dropped
    std::vector<std::string> get_list(const std::string& key,
                                      char sep = ',',
                                      const EnvOpts<std::vector<std::string>>& opts = {}) const;
    nlohmann::json get_json(const std::string& key, const EnvOpts<nlohmann::json>& opts = {}) const;

private:
    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::string> map_;

    // nullopt: missing and not required (caller falls back to default)
    std::optional<std::string> fetch(const std::string& key, bool required, bool trim) const;
};
