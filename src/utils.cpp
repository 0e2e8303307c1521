#include "vpconv/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <locale>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace vpconv {

static inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && is_space(s[b])) ++b;
  size_t e = s.size();
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool istarts_with(const std::string& s, const std::string& prefix) {
  return starts_with(to_lower(s), to_lower(prefix));
}

bool icontains(const std::string& s, const std::string& needle) {
  if (needle.empty()) return true;
  return to_lower(s).find(to_lower(needle)) != std::string::npos;
}

namespace {

template <typename T>
T parse_number(const std::string& s, const char* what) {
  const std::string t = trim(s);
  std::istringstream iss(t);
  iss.imbue(std::locale::classic());
  T v{};
  iss >> v;
  if (t.empty() || iss.fail() || !(iss >> std::ws).eof()) {
    throw std::runtime_error(std::string("Failed to parse ") + what + " from '" + s + "'");
  }
  return v;
}

} // namespace

int to_int(const std::string& s) {
  return parse_number<int>(s, "int");
}

double to_double(const std::string& s) {
  return parse_number<double>(s, "number");
}

bool file_exists(const std::string& path) {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::u8path(path), ec);
}

bool remove_file_quiet(const std::string& path) {
  std::error_code ec;
  const std::filesystem::path p = std::filesystem::u8path(path);
  std::filesystem::remove(p, ec);
  return !std::filesystem::exists(p, ec);
}

std::string random_hex_token(size_t n_bytes) {
  static const char* kHex = "0123456789abcdef";
  std::random_device rd;
  std::uniform_int_distribution<int> byte(0, 255);

  std::string out;
  out.reserve(n_bytes * 2);
  for (size_t i = 0; i < n_bytes; ++i) {
    const int b = byte(rd);
    out.push_back(kHex[(b >> 4) & 0x0F]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

bool write_text_file_atomic(const std::string& path, const std::string& content) {
  const std::filesystem::path target = std::filesystem::u8path(path);
  std::filesystem::path tmp = target;
  tmp += ".tmp." + random_hex_token(8);

  std::error_code ec;
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out << content;
    out.close();
    if (!out) {
      std::filesystem::remove(tmp, ec);
      return false;
    }
  }

  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    // Windows refuses to rename over an existing file.
    std::error_code rm_ec;
    std::filesystem::remove(target, rm_ec);
    ec.clear();
    std::filesystem::rename(tmp, target, ec);
  }
  if (ec) {
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
    return false;
  }
  return true;
}

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (unsigned char uc : s) {
    switch (uc) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (uc < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(uc));
          out += buf;
        } else {
          out.push_back(static_cast<char>(uc));
        }
        break;
    }
  }
  return out;
}

std::string json_number(double x) {
  if (!std::isfinite(x)) return "null";
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  if (x == std::floor(x) && std::fabs(x) < 1e15) {
    oss << static_cast<long long>(x);
  } else {
    oss << std::setprecision(15) << x;
  }
  return oss.str();
}

} // namespace vpconv
