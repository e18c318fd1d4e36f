/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file config.hpp
 * @brief Supervisor configuration: multi-format reader plus typed settings.
 *
 * Design:
 *   - Tag dispatch: IniBackend / JsonBackend / YamlBackend type tags
 *   - ConfigParser<Backend> specialization per format
 *   - Config<Backends...> composes the enabled formats at compile time
 *
 * Supported backends (CMake opt-in, enabled when the library is found):
 *   - IniBackend  : inih          (PGS_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (PGS_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (PGS_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to "section.key = value". Nested objects deeper
 * than one level are not supported.
 *
 * Usage:
 * @code
 *   pgs::MultiConfig cfg;
 *   auto r = cfg.LoadFile("/etc/pgs/pgs.ini");
 *   auto sc = pgs::LoadSupervisorConfig(cfg);  // Result<SupervisorConfig>
 * @endcode
 */

#ifndef PGS_CONFIG_HPP_
#define PGS_CONFIG_HPP_

#include "pgs/error.hpp"
#include "pgs/log.hpp"
#include "pgs/platform.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <tuple>
#include <vector>

#ifdef PGS_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef PGS_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef PGS_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace pgs {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline bool StrCaseEqual(const std::string& a, const char* b) noexcept {
  size_t i = 0;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    if (AsciiLower(a[i]) != AsciiLower(b[i])) return false;
  }
  return i == a.size() && b[i] == '\0';
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") || detail::StrCaseEqual(ext, "cfg") ||
           detail::StrCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::StrCaseEqual(ext, "yaml") || detail::StrCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore - flat section/key/value storage
// ============================================================================

class ConfigStore {
 public:
  std::string GetString(const char* section, const char* key,
                        const std::string& default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int64_t GetInt(const char* section, const char* key,
                 int64_t default_val = 0) const {
    optional<int64_t> v = FindInt(section, key);
    return v ? *v : default_val;
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  optional<int64_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long long val = std::strtoll(e->value.c_str(), &end, 10);
    if (end == e->value.c_str()) return {};
    return optional<int64_t>{static_cast<int64_t>(val)};
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  /// @brief Insert or overwrite one value (section and key match case-insensitively).
  void Set(const std::string& section, const std::string& key,
           const std::string& value) {
    for (auto& e : entries_) {
      if (detail::StrCaseEqual(e.section, section.c_str()) &&
          detail::StrCaseEqual(e.key, key.c_str())) {
        e.value = value;
        return;
      }
    }
    entries_.push_back(Entry{section, key, value});
  }

  size_t EntryCount() const noexcept { return entries_.size(); }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  const Entry* FindEntry(const char* section, const char* key) const {
    PGS_ASSERT(section != nullptr && key != nullptr);
    for (const auto& e : entries_) {
      if (detail::StrCaseEqual(e.section, section) &&
          detail::StrCaseEqual(e.key, key))
        return &e;
    }
    return nullptr;
  }

  static bool ParseBool(const std::string& str) noexcept {
    return detail::StrCaseEqual(str, "true") || detail::StrCaseEqual(str, "1") ||
           detail::StrCaseEqual(str, "yes") || detail::StrCaseEqual(str, "on");
  }

  static Result<std::string> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return Result<std::string>::error(Error::FromErrno(
          ErrorCode::kNotFound, std::string("opening ") + path, errno));
    }
    std::string data;
    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
      data.append(buf, n);
    }
    const bool failed = std::ferror(f) != 0;
    std::fclose(f);
    if (failed) {
      return Result<std::string>::error(
          Error(ErrorCode::kIo, std::string("reading ") + path));
    }
    return Result<std::string>::success(std::move(data));
  }

  static std::string GetExtension(const char* path) {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? std::string(dot + 1) : std::string();
  }

  std::vector<Entry> entries_;

  template <typename> friend struct ConfigParser;
};

inline Error ConfigParseError(const char* format, const std::string& what) {
  return Error(ErrorCode::kInvalidArgument,
               std::string("parsing ") + format + " config: " + what);
}

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Default: format not compiled in. */
template <typename Backend>
struct ConfigParser {
  static Status ParseFile(ConfigStore&, const char*) { return Unsupported(); }
  static Status ParseBuffer(ConfigStore&, const std::string&) { return Unsupported(); }

 private:
  static Status Unsupported() {
    return Fail(Error(ErrorCode::kInvalidArgument, "config format not supported"));
  }
};

// --- INI ---

#ifdef PGS_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static Status ParseFile(ConfigStore& store, const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1) {
      return Fail(Error(ErrorCode::kNotFound, std::string("opening ") + path));
    }
    if (result != 0) {
      return Fail(ConfigParseError("ini", "error on line " + std::to_string(result)));
    }
    return Ok();
  }

  static Status ParseBuffer(ConfigStore& store, const std::string& data) {
    int result = ini_parse_string(data.c_str(), Handler, &store);
    if (result != 0) {
      return Fail(ConfigParseError("ini", "error on line " + std::to_string(result)));
    }
    return Ok();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    s->Set(section ? section : "", name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

// --- JSON ---

#ifdef PGS_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static Status ParseFile(ConfigStore& store, const char* path) {
    auto data = ConfigStore::ReadFile(path);
    if (!data) return Fail(data.get_error());
    return ParseBuffer(store, data.value());
  }

  static Status ParseBuffer(ConfigStore& store, const std::string& data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return Fail(ConfigParseError("json", "top level must be an object"));
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.Set(it.key(), kit.key(), ToStr(*kit));
        }
      } else {
        store.Set("", it.key(), ToStr(*it));
      }
    }
    return Ok();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    return n.dump();
  }
};
#endif

// --- YAML ---

#ifdef PGS_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static Status ParseFile(ConfigStore& store, const char* path) {
    auto data = ConfigStore::ReadFile(path);
    if (!data) return Fail(data.get_error());
    return ParseBuffer(store, data.value());
  }

  static Status ParseBuffer(ConfigStore& store, const std::string& data) {
    auto root = fkyaml::node::deserialize(data);
    if (root.is_null() || !root.is_mapping()) {
      return Fail(ConfigParseError("yaml", "top level must be a mapping"));
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          store.Set(sec, kit.key().get_value<std::string>(), ToStr(*kit));
        }
      } else {
        store.Set("", sec, ToStr(node));
      }
    }
    return Ok();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  Status LoadFile(const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    PGS_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    Status st = DispatchFile<Backends...>(path, format);
    if (st) {
      PGS_LOG_INFO("Config", "loaded %s (%zu entries)", path, EntryCount());
    }
    return st;
  }

  Status LoadBuffer(const std::string& data, ConfigFormat format) {
    return DispatchBuffer<Backends...>(data, format);
  }

 private:
  template <typename First, typename... Rest>
  Status DispatchFile(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) return DispatchFile<Rest...>(path, format);
    return Fail(Error(ErrorCode::kInvalidArgument, "config format not supported"));
  }

  template <typename First, typename... Rest>
  Status DispatchBuffer(const std::string& data, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseBuffer(*this, data);
    if constexpr (sizeof...(Rest) > 0) return DispatchBuffer<Rest...>(data, format);
    return Fail(Error(ErrorCode::kInvalidArgument, "config format not supported"));
  }

  ConfigFormat DetectFormat(const char* path) const {
    const std::string ext = GetExtension(path);
    if (ext.empty()) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const std::string& ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

#if defined(PGS_CONFIG_INI_ENABLED) || defined(PGS_CONFIG_JSON_ENABLED) || \
    defined(PGS_CONFIG_YAML_ENABLED)
using MultiConfig = Config<
#ifdef PGS_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(PGS_CONFIG_INI_ENABLED) && \
    (defined(PGS_CONFIG_JSON_ENABLED) || defined(PGS_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef PGS_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(PGS_CONFIG_JSON_ENABLED) && defined(PGS_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef PGS_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#define PGS_CONFIG_HAS_BACKEND 1
#endif

// ============================================================================
// SupervisorConfig
// ============================================================================

struct SupervisorConfig {
  /// Holds the database file and the capture files.
  std::string root = ".pgs";
  std::string db_file = "groups.db";
  std::chrono::milliseconds wait_timeout{10000};
  std::chrono::milliseconds close_grace{2000};
  std::chrono::milliseconds stop_grace{2000};
  std::chrono::milliseconds drain_timeout{1000};
  bool recover_on_start = false;
  log::Level log_level = log::Level::kInfo;

  std::string DbPath() const { return root + "/" + db_file; }
};

/// @brief "debug", "info", "warn", "error", "fatal", "off" (any case).
inline optional<log::Level> ParseLogLevel(const std::string& name) {
  static const struct {
    const char* name;
    log::Level level;
  } kLevels[] = {
      {"debug", log::Level::kDebug}, {"info", log::Level::kInfo},
      {"warn", log::Level::kWarn},   {"warning", log::Level::kWarn},
      {"error", log::Level::kError}, {"fatal", log::Level::kFatal},
      {"off", log::Level::kOff},
  };
  for (const auto& l : kLevels) {
    if (detail::StrCaseEqual(name, l.name)) return l.level;
  }
  return {};
}

/**
 * @brief Map a loaded store onto SupervisorConfig.
 *
 * Missing keys keep their defaults. Non-positive durations and unknown log
 * levels are rejected with kInvalidArgument.
 */
inline Result<SupervisorConfig> LoadSupervisorConfig(const ConfigStore& store) {
  using R = Result<SupervisorConfig>;
  SupervisorConfig cfg;
  cfg.root = store.GetString("supervisor", "root", cfg.root);
  cfg.db_file = store.GetString("supervisor", "db_file", cfg.db_file);
  cfg.recover_on_start =
      store.GetBool("supervisor", "recover_on_start", cfg.recover_on_start);

  if (cfg.root.empty() || cfg.db_file.empty()) {
    return R::error(Error(ErrorCode::kInvalidArgument,
                          "supervisor.root and supervisor.db_file must not be empty"));
  }

  struct Duration {
    const char* key;
    std::chrono::milliseconds* field;
  };
  const Duration durations[] = {
      {"wait_timeout_ms", &cfg.wait_timeout},
      {"close_grace_ms", &cfg.close_grace},
      {"stop_grace_ms", &cfg.stop_grace},
      {"drain_timeout_ms", &cfg.drain_timeout},
  };
  for (const auto& d : durations) {
    if (!store.HasKey("supervisor", d.key)) continue;
    optional<int64_t> ms = store.FindInt("supervisor", d.key);
    if (!ms || *ms <= 0) {
      return R::error(Error(ErrorCode::kInvalidArgument,
                            std::string("supervisor.") + d.key +
                                " must be a positive number of milliseconds"));
    }
    *d.field = std::chrono::milliseconds(*ms);
  }

  if (store.HasKey("log", "level")) {
    const std::string name = store.GetString("log", "level");
    optional<log::Level> level = ParseLogLevel(name);
    if (!level) {
      return R::error(Error(ErrorCode::kInvalidArgument,
                            "unknown log.level '" + name + "'"));
    }
    cfg.log_level = *level;
  }
  return R::success(std::move(cfg));
}

}  // namespace pgs

#endif  // PGS_CONFIG_HPP_
