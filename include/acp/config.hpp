/**
 * @file config.hpp
 * @brief Multi-format configuration reader with template-based backend dispatch.
 *
 * Design patterns:
 *   - Tag dispatch: IniBackend / JsonBackend / YamlBackend type tags
 *   - Template specialization: ConfigParser<Backend> per-format parsers
 *   - Variadic templates: Config<Backends...> compile-time composition
 *
 * Supported backends (CMake opt-in):
 *   - IniBackend  : inih library       (ACP_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json      (ACP_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML             (ACP_CONFIG_YAML_ENABLED)
 *
 * All formats are flattened to a "section + key = value" model. Nested
 * JSON/YAML mappings become dotted section names, so
 *   {"budget": {"cost": {"limit": 10}}}
 * and the INI
 *   [budget.cost]
 *   limit = 10
 * produce the same entry. ConfigStore can also be filled programmatically
 * through Set(), which is how callers without a config file build a policy.
 */

#ifndef ACP_CONFIG_HPP_
#define ACP_CONFIG_HPP_

#include "acp/platform.hpp"
#include "acp/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#ifdef ACP_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef ACP_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef ACP_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace acp {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

// ============================================================================
// Backend Tag Types
// ============================================================================

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline bool StrCaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    if (AsciiLower(*a) != AsciiLower(*b)) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") || detail::StrCaseEqual(ext, "cfg") ||
           detail::StrCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "yaml") || detail::StrCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore - flat section/key/value storage
// ============================================================================

#ifndef ACP_CONFIG_MAX_ENTRIES
#define ACP_CONFIG_MAX_ENTRIES 512U
#endif

#ifndef ACP_CONFIG_MAX_FILE_SIZE
#define ACP_CONFIG_MAX_FILE_SIZE 65536U
#endif

class ConfigStore {
 public:
  // --- Typed getters (default on missing or malformed) ---

  std::string GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : std::string(default_val);
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const {
    auto v = FindInt(section, key);
    return v.has_value() ? *v : default_val;
  }

  uint64_t GetUint64(const char* section, const char* key,
                     uint64_t default_val = 0U) const {
    auto v = FindUint64(section, key);
    return v.has_value() ? *v : default_val;
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    auto v = FindBool(section, key);
    return v.has_value() ? *v : default_val;
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    auto v = FindDouble(section, key);
    return v.has_value() ? *v : default_val;
  }

  // --- Optional getters (nullopt on missing or malformed) ---

  std::optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return std::nullopt;
    const char* s = e->value.c_str();
    char* end = nullptr;
    errno = 0;
    long val = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || errno == ERANGE || val < INT32_MIN ||
        val > INT32_MAX) {
      return std::nullopt;
    }
    return static_cast<int32_t>(val);
  }

  /// Rejects negative and non-numeric values.
  std::optional<uint64_t> FindUint64(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return std::nullopt;
    const char* s = e->value.c_str();
    if (*s == '-' || *s == '\0') return std::nullopt;
    char* end = nullptr;
    errno = 0;
    unsigned long long val = std::strtoull(s, &end, 10);
    if (end == s || *end != '\0' || errno == ERANGE) return std::nullopt;
    return static_cast<uint64_t>(val);
  }

  std::optional<double> FindDouble(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return std::nullopt;
    const char* s = e->value.c_str();
    char* end = nullptr;
    double val = std::strtod(s, &end);
    if (end == s || *end != '\0') return std::nullopt;
    return val;
  }

  /// true/1/yes/on and false/0/no/off; anything else is nullopt.
  std::optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return std::nullopt;
    const char* s = e->value.c_str();
    if (detail::StrCaseEqual(s, "true") || detail::StrCaseEqual(s, "1") ||
        detail::StrCaseEqual(s, "yes") || detail::StrCaseEqual(s, "on")) {
      return true;
    }
    if (detail::StrCaseEqual(s, "false") || detail::StrCaseEqual(s, "0") ||
        detail::StrCaseEqual(s, "no") || detail::StrCaseEqual(s, "off")) {
      return false;
    }
    return std::nullopt;
  }

  // --- Mutation ---

  /// Insert or overwrite one entry.
  expected<void, ConfigError> Set(const char* section, const char* key,
                                  const char* value) {
    ACP_ASSERT(section != nullptr && key != nullptr && value != nullptr);
    if (!AddEntry(section, key, value)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

  // --- Query ---

  bool HasSection(const char* section) const {
    ACP_ASSERT(section != nullptr);
    for (const auto& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  /// Visit every key of `section` in insertion order: fn(key, value).
  template <typename Fn>
  void ForEachKey(const char* section, Fn&& fn) const {
    for (const auto& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section)) {
        fn(e.key, e.value);
      }
    }
  }

  /// Visit every entry: fn(section, key, value).
  template <typename Fn>
  void ForEachEntry(Fn&& fn) const {
    for (const auto& e : entries_) {
      fn(e.section, e.key, e.value);
    }
  }

  uint32_t EntryCount() const noexcept { return static_cast<uint32_t>(entries_.size()); }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  std::vector<Entry> entries_;

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (auto& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section) &&
          detail::StrCaseEqual(e.key.c_str(), key)) {
        e.value = value;
        return true;
      }
    }
    if (entries_.size() >= ACP_CONFIG_MAX_ENTRIES) return false;
    entries_.push_back(Entry{section, key, value});
    return true;
  }

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
    }
    std::string buf(ACP_CONFIG_MAX_FILE_SIZE, '\0');
    size_t bytes = std::fread(&buf[0], 1, buf.size(), f);
    const bool truncated = (bytes == buf.size()) && std::fgetc(f) != EOF;
    (void)std::fclose(f);
    if (truncated) {
      return expected<std::string, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf.resize(bytes);
    return expected<std::string, ConfigError>::success(std::move(buf));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    ACP_ASSERT(section != nullptr && key != nullptr);
    for (const auto& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section) &&
          detail::StrCaseEqual(e.key.c_str(), key)) {
        return &e;
      }
    }
    return nullptr;
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  static std::string JoinSection(const std::string& parent, const std::string& child) {
    return parent.empty() ? child : parent + "." + child;
  }

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Default: format not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

// --- INI Backend ---

#ifdef ACP_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    Context ctx{&store, false};
    int result = ini_parse(path, Handler, &ctx);
    if (result == -1) return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (ctx.full) return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    if (result != 0) return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    Context ctx{&store, false};
    int result = ini_parse_string(data.c_str(), Handler, &ctx);
    if (ctx.full) return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    if (result != 0) return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

 private:
  struct Context {
    ConfigStore* store;
    bool full;
  };

  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* ctx = static_cast<Context*>(user);
    if (!ctx->store->AddEntry(section ? section : "", name ? name : "",
                              value ? value : "")) {
      ctx->full = true;
      return 0;
    }
    return 1;
  }
};
#endif

// --- JSON Backend ---

#ifdef ACP_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!Flatten(store, std::string(), j)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Flatten(ConfigStore& store, const std::string& section,
                      const nlohmann::json& obj) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
      if (it->is_object()) {
        if (!Flatten(store, ConfigStore::JoinSection(section, it.key()), *it)) {
          return false;
        }
      } else if (!store.AddEntry(section.c_str(), it.key().c_str(),
                                 ToStr(*it).c_str())) {
        return false;
      }
    }
    return true;
  }

  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_unsigned()) return std::to_string(n.get<uint64_t>());
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    if (n.is_number_float()) {
      char b[64];
      (void)std::snprintf(b, sizeof(b), "%.17g", n.get<double>());
      return b;
    }
    return n.dump();
  }
};
#endif

// --- YAML Backend ---

#ifdef ACP_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(data);
    } catch (const fkyaml::exception&) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!Flatten(store, std::string(), root)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Flatten(ConfigStore& store, const std::string& section,
                      fkyaml::node& map) {
    for (auto it = map.begin(); it != map.end(); ++it) {
      auto key = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        if (!Flatten(store, ConfigStore::JoinSection(section, key), node)) return false;
      } else if (!store.AddEntry(section.c_str(), key.c_str(), ToStr(node).c_str())) {
        return false;
      }
    }
    return true;
  }

  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) {
      char b[64];
      (void)std::snprintf(b, sizeof(b), "%.17g", n.get_value<double>());
      return b;
    }
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

  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    ACP_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data, ConfigFormat format) {
    return DispatchBuffer<Backends...>(data, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const std::string& data,
                                             ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseBuffer(*this, data);
    if constexpr (sizeof...(Rest) > 0) return DispatchBuffer<Rest...>(data, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

#ifdef ACP_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef ACP_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef ACP_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace acp

#endif  // ACP_CONFIG_HPP_
