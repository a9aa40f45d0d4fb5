#include "teledrop/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace teledrop::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::optional<std::uint32_t> parse_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

std::size_t value_start(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return std::string::npos;
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return std::string::npos;
  }
  const std::size_t pos = json_skip_ws(json, colon + 1);
  return pos < json.size() ? pos : std::string::npos;
}

std::size_t scalar_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      auto code = parse_hex4(raw, i + 1);
      if (!code.has_value()) {
        out.push_back(next);
        break;
      }
      i += 4;
      if (*code >= 0xD800 && *code <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        const auto low = parse_hex4(raw, i + 3);
        if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          *code = 0x10000 + ((*code - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, *code);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_find_key(const std::string &json, const std::string &key, std::size_t from) {
  const std::string quoted = "\"" + key + "\"";
  return json.find(quoted, from);
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const std::size_t pos = value_start(json, field);
  if (pos == std::string::npos || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const std::size_t pos = value_start(json, field);
  if (pos == std::string::npos) {
    return "";
  }
  const char first = json[pos];
  if (first != '-' && std::isdigit(static_cast<unsigned char>(first)) == 0) {
    return "";
  }
  return json.substr(pos, scalar_end(json, pos) - pos);
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const std::size_t pos = value_start(json, field);
  if (pos == std::string::npos || json[pos] != '{') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '{', '}');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::optional<bool> json_get_bool(const std::string &json, const std::string &field) {
  const std::size_t pos = value_start(json, field);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  const std::string token = json.substr(pos, scalar_end(json, pos) - pos);
  if (token == "true") {
    return true;
  }
  if (token == "false") {
    return false;
  }
  return std::nullopt;
}

std::optional<JsonFlatMap> json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return std::nullopt;
  }
  const auto object_end = json_find_matching_token(json, pos, '{', '}');
  if (object_end == std::string::npos) {
    return std::nullopt;
  }

  ++pos;
  while (pos < object_end) {
    pos = json_skip_ws(json, pos);
    if (pos >= object_end) {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      return std::nullopt;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos || key_end >= object_end) {
      return std::nullopt;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= object_end || json[pos] != ':') {
      return std::nullopt;
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= object_end) {
      return std::nullopt;
    }

    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos || val_end >= object_end) {
        return std::nullopt;
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close);
      if (end == std::string::npos || end >= object_end) {
        return std::nullopt;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t end = scalar_end(json, pos);
      if (end == pos) {
        return std::nullopt;
      }
      const std::string token = json.substr(pos, end - pos);
      if (token != "null") {
        result[key] = token;
      }
      pos = end;
    }
  }

  return result;
}

} // namespace teledrop::common
