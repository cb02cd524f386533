/**
 * @file config.hpp
 * @brief Flat "section / key = value" configuration store with pluggable
 *        file-format backends.
 *
 * Backends (CMake opt-in):
 *   - IniBackend  : inih          (HOSTLINK_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (HOSTLINK_CONFIG_JSON_ENABLED)
 *
 * JSON objects are flattened one level deep: top-level objects become
 * sections, scalar members become keys. Top-level scalars land in section "".
 * Section and key lookups are case-insensitive.
 *
 * @code
 *   hostlink::MultiConfig cfg;
 *   if (cfg.LoadFile("hostlink.ini").has_value()) {
 *     uint16_t port = cfg.GetPort("agent", "port", 42699);
 *   }
 * @endcode
 */

#ifndef HOSTLINK_CONFIG_HPP_
#define HOSTLINK_CONFIG_HPP_

#include "hostlink/platform.hpp"
#include "hostlink/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>

#ifdef HOSTLINK_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef HOSTLINK_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

namespace hostlink {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend Tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef HOSTLINK_CONFIG_MAX_FILE_SIZE
#define HOSTLINK_CONFIG_MAX_FILE_SIZE 8192U
#endif

class ConfigStore {
 public:
  /** @brief Raw value, or nullptr if the key is absent. */
  const char* FindString(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : nullptr;
  }

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const char* v = FindString(section, key);
    return (v != nullptr) ? v : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    auto v = ParseInt(FindString(section, key));
    if (!v.has_value() || v.value() < INT32_MIN || v.value() > INT32_MAX) {
      return default_val;
    }
    return static_cast<int32_t>(v.value());
  }

  /** @brief Port in [1, 65535]; anything else yields @p default_val. */
  uint16_t GetPort(const char* section, const char* key,
                   uint16_t default_val = 0) const {
    auto v = ParseInt(FindString(section, key));
    if (!v.has_value() || v.value() < 1 || v.value() > 65535) {
      return default_val;
    }
    return static_cast<uint16_t>(v.value());
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const char* v = FindString(section, key);
    return (v != nullptr) ? ParseBool(v) : default_val;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /** @brief Whole-string decimal integer; empty if @p str is not one. */
  static optional<int64_t> ParseInt(const char* str) noexcept {
    if (str == nullptr || *str == '\0') {
      return optional<int64_t>();
    }
    char* end = nullptr;
    const long long val = std::strtoll(str, &end, 10);
    if (end == str || *end != '\0') {
      return optional<int64_t>();
    }
    return optional<int64_t>(static_cast<int64_t>(val));
  }

  static bool ParseBool(const char* str) noexcept {
    if (str == nullptr) return false;
    return detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
           detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on");
  }

 protected:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 64;
  static constexpr uint32_t kMaxValueLen = 256;

  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  /** @return false when the store is full. A repeated key is overwritten. */
  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_++];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    return true;
  }

  static expected<uint32_t, ConfigError> ReadFileToBuffer(const char* path,
                                                          char* buf,
                                                          uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    const size_t bytes = std::fread(buf, 1, buf_size - 1U, f);
    const bool truncated = (bytes == buf_size - 1U) && std::fgetc(f) != EOF;
    std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(
        static_cast<uint32_t>(bytes));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    HOSTLINK_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') {
      dst[i] = src[i];
      ++i;
    }
    dst[i] = '\0';
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    const char* slash = std::strrchr(path, '/');
    if (dot == nullptr || (slash != nullptr && dot < slash)) {
      return nullptr;
    }
    return dot + 1;
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backends compiled out report kFormatNotSupported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef HOSTLINK_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    const int result = ini_parse(path, &Handler, &store);
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  /** @p data need not be NUL-terminated; exactly @p size bytes are read. */
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    const std::string text(data, size);
    if (ini_parse_string(text.c_str(), &Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->AddEntry(section != nullptr ? section : "",
                           name != nullptr ? name : "",
                           value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif  // HOSTLINK_CONFIG_INI_ENABLED

#ifdef HOSTLINK_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[HOSTLINK_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    char val[ConfigStore::kMaxValueLen];
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (!it->is_object()) {
        ToStr(*it, val, sizeof(val));
        if (!store.AddEntry("", it.key().c_str(), val)) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
        continue;
      }
      for (auto kit = it->begin(); kit != it->end(); ++kit) {
        ToStr(*kit, val, sizeof(val));
        if (!store.AddEntry(it.key().c_str(), kit.key().c_str(), val)) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static void ToStr(const nlohmann::json& node, char* buf, uint32_t size) {
    if (node.is_string()) {
      ConfigStore::SafeCopy(buf, node.get_ref<const std::string&>().c_str(),
                            size);
    } else if (node.is_boolean()) {
      ConfigStore::SafeCopy(buf, node.get<bool>() ? "true" : "false", size);
    } else if (node.is_number_integer()) {
      (void)std::snprintf(buf, size, "%lld",
                          static_cast<long long>(node.get<int64_t>()));
    } else if (node.is_number_float()) {
      (void)std::snprintf(buf, size, "%g", node.get<double>());
    } else {
      const std::string dumped = node.dump();
      ConfigStore::SafeCopy(buf, dumped.c_str(), size);
    }
  }
};
#endif  // HOSTLINK_CONFIG_JSON_ENABLED

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  /** @brief Parse @p path; kAuto picks the backend from the extension. */
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    HOSTLINK_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) {
      format = DetectFormat(path);
    }
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    HOSTLINK_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    return (ext == nullptr) ? Head::kFormat : DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    }
    return Head::kFormat;
  }
};

// ============================================================================
// Aliases
// ============================================================================

#if defined(HOSTLINK_CONFIG_INI_ENABLED) && defined(HOSTLINK_CONFIG_JSON_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend>;
#elif defined(HOSTLINK_CONFIG_INI_ENABLED)
using MultiConfig = Config<IniBackend>;
#elif defined(HOSTLINK_CONFIG_JSON_ENABLED)
using MultiConfig = Config<JsonBackend>;
#endif

#ifdef HOSTLINK_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef HOSTLINK_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif

}  // namespace hostlink

#endif  // HOSTLINK_CONFIG_HPP_
