#ifndef __IGV_BATCH_COMMAND__
#define __IGV_BATCH_COMMAND__

#include "Headers.hpp"
#include "IgvErrors.hpp"

namespace igv {
/**
 * @brief One positional argument of a batch command, already normalized to
 * text, or absent.
 *
 * This is the only place where strings, numbers and booleans become wire
 * text. Absent arguments are dropped by encodeCommand() rather than sent as
 * empty tokens.
 */
class CommandArg {
 public:
  CommandArg() {}
  CommandArg(std::nullopt_t) {}
  CommandArg(const string& s) : text(s) {}
  CommandArg(const char* s) {
    if (s) {
      text = string(s);
    }
  }
  CommandArg(const optional<string>& s) : text(s) {}
  CommandArg(bool b) : text(b ? "true" : "false") {}
  /** @brief A character is sent as itself, not as its code point. */
  CommandArg(char c) : text(string(1, c)) {}
  // signed/unsigned char stay numeric: they are int8_t/uint8_t
  template <typename T,
            typename std::enable_if<std::is_integral<T>::value &&
                                        !std::is_same<T, bool>::value &&
                                        !std::is_same<T, char>::value &&
                                        !std::is_same<T, wchar_t>::value &&
                                        !std::is_same<T, char16_t>::value &&
                                        !std::is_same<T, char32_t>::value,
                                    int>::type = 0>
  CommandArg(T value) : text(std::to_string(value)) {}
  /**
   * @brief Shortest text that reads back as the same double, never in
   * exponent form when plain digits are no longer.
   * @throws InvalidArgument for NaN and infinities.
   */
  CommandArg(double value);

  bool isAbsent() const { return !text.has_value(); }

  const string& value() const { return *text; }

 protected:
  optional<string> text;
};

/**
 * @brief Builds one protocol line: the name followed by every present
 * argument, space-joined in order, with surrounding whitespace trimmed.
 * @throws InvalidArgument when the name is empty or any token contains a
 * line terminator.
 */
string encodeCommand(const string& name, const vector<CommandArg>& args);

/** @brief Expands `~` and makes the path absolute and lexically normal. */
string expandPath(const string& path);

/**
 * @brief True when `text` starts with a URI scheme (`http:`, `s3:` ...) and
 * is otherwise a well-formed URI. Malformed URIs count as plain paths.
 */
bool hasUriScheme(const string& text);

/** @brief URLs pass through verbatim, everything else is expandPath()ed. */
string pathOrUrl(const string& text);

/**
 * @brief The absolute path when it names an existing file, otherwise the
 * text itself (a reference genome id such as "hg19").
 */
string genomeArgument(const string& nameOrPath);

/** @brief Options accepted by the `sort` command, in protocol spelling. */
const vector<string>& sortOptions();

/** @throws InvalidOption when `option` is not one of sortOptions(). */
void validateSortOption(const string& option);

/** @throws InvalidOption unless `strand` is "+" or "-". */
void validateStrand(const string& strand);
}  // namespace igv

#endif  // __IGV_BATCH_COMMAND__
