#include <showlink/log_line_codec.h>

namespace showlink {

std::string EscapeLogLine(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '\\') {
      escaped.append("\\\\");
      continue;
    }
    if (character == '\n') {
      escaped.append("\\n");
      continue;
    }
    if (character == '\r') {
      escaped.append("\\r");
      continue;
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::string UnescapeLogLine(const std::string &value) {
  std::string unescaped;
  unescaped.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 1 < value.size()) {
      const auto next = value[i + 1];
      ++i;
      if (next == 'n') {
        unescaped.push_back('\n');
        continue;
      }
      if (next == 'r') {
        unescaped.push_back('\r');
        continue;
      }
      unescaped.push_back(next);
      continue;
    }
    unescaped.push_back(value[i]);
  }
  return unescaped;
}

std::string EncodePath(const std::filesystem::path &path) {
  return EscapeLogLine(path.string());
}

std::filesystem::path DecodePath(const std::string &line) {
  return std::filesystem::path(UnescapeLogLine(line));
}

} // namespace showlink
