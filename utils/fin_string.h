#ifndef fin_STRING_H
#define fin_STRING_H

#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <ostream>

// Wrapper around std::string to provide additional functionality
class fin_string
{
  std::string str;
public:
  static const size_t npos = std::string::npos;
  fin_string() : str() {}
  fin_string(const char* s) : str(s ? s : "") {}
  fin_string(const char* s, size_t len) : str(s, len) {}
  fin_string(const std::string& s) : str(s) {}

  // numbers and single chars
  fin_string(int i) : str(std::to_string(i)) {}
  fin_string(long i) : str(std::to_string(i)) {}
  fin_string(long long i) : str(std::to_string(i)) {}
  fin_string(unsigned long i) : str(std::to_string(i)) {}
  fin_string(double d) : str(std::to_string(d)) {}
  fin_string(char c) : str(1, c) {}

  std::string& to_std() { return str; }
  const std::string& to_std_const() const { return str; }
  const char* c_str() const { return str.c_str(); }
  const char* data() const { return str.data(); }

  fin_string operator+(const fin_string& s) const { return str + s.str; }
  fin_string operator+(const char* s) const { return str + s; }
  fin_string& operator+=(const fin_string& s) { str += s.str; return *this; }
  fin_string& operator+=(char c) { str += c; return *this; }
  bool operator==(const fin_string& s) const { return str == s.str; }
  bool operator!=(const fin_string& s) const { return str != s.str; }
  bool operator<(const fin_string& s) const { return str < s.str; }

  bool empty() const { return str.empty(); }
  size_t size() const { return str.size(); }
  size_t length() const { return str.length(); }
  void clear() { str.clear(); }

  char& operator[](size_t i) { return str[i]; }
  const char& operator[](size_t i) const { return str[i]; }

  fin_string substr(size_t pos, size_t len = npos) const
  {
    if (pos >= str.size()) return fin_string();
    return str.substr(pos, len);
  }

  long long to_int(long long def = 0) const
  {
    try
    {
      return std::stoll(str);
    }
    catch (const std::invalid_argument&)
    {
      return def;
    }
    catch (const std::out_of_range&)
    {
      return def;
    }
  }

  double to_double(double def = 0) const
  {
    try
    {
      return std::stod(str);
    }
    catch (const std::invalid_argument&)
    {
      return def;
    }
    catch (const std::out_of_range&)
    {
      return def;
    }
  }

  bool is_integer() const
  {
    if (str.empty()) return false;
    size_t start = (str[0] == '-' || str[0] == '+') ? 1 : 0;
    if (start >= str.size()) return false;
    for (size_t i = start; i < str.size(); ++i)
    {
      if (!std::isdigit(static_cast<unsigned char>(str[i]))) return false;
    }
    return true;
  }

  bool is_double() const
  {
    try
    {
      size_t used = 0;
      std::stod(str, &used);
      return used == str.size();
    }
    catch (const std::invalid_argument&)
    {
      return false;
    }
    catch (const std::out_of_range&)
    {
      return false;
    }
  }

  size_t find(const fin_string& s, size_t pos = 0) const { return str.find(s.str, pos); }
  size_t rfind(const fin_string& s) const { return str.rfind(s.str); }
  bool contains(const fin_string& s) const { return str.find(s.str) != std::string::npos; }

  fin_string lower() const
  {
    fin_string res = *this;
    for (size_t i = 0; i < res.size(); ++i)
    {
      res[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(res[i])));
    }
    return res;
  }

  fin_string upper() const
  {
    fin_string res = *this;
    for (size_t i = 0; i < res.size(); ++i)
    {
      res[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(res[i])));
    }
    return res;
  }

  fin_string& replace(const fin_string& from, const fin_string& to)
  {
    if (from.empty()) return *this;
    for (size_t pos = 0; (pos = str.find(from.str, pos)) != std::string::npos; pos += to.size())
    {
      str.replace(pos, from.size(), to.str);
    }
    return *this;
  }

  fin_string& erase(size_t pos = 0, size_t len = std::string::npos)
  {
    str.erase(pos, len);
    return *this;
  }

  fin_string& append(const fin_string& s)
  {
    str.append(s.str);
    return *this;
  }

  fin_string& append(const char* s, size_t len)
  {
    str.append(s, len);
    return *this;
  }

  size_t split(const fin_string& delim, std::vector<fin_string>& out) const
  {
    size_t pos = 0;
    size_t last = 0;
    while ((pos = str.find(delim.str, last)) != std::string::npos)
    {
      out.push_back(str.substr(last, pos - last));
      last = pos + delim.size();
    }
    out.push_back(str.substr(last));
    return out.size();
  }

  std::vector<fin_string> split(const fin_string& delim) const
  {
    std::vector<fin_string> out;
    split(delim, out);
    return out;
  }

  // Whitespace split, empty parts dropped
  std::vector<fin_string> words() const
  {
    std::vector<fin_string> out;
    size_t i = 0;
    while (i < str.size())
    {
      while (i < str.size() && std::isspace(static_cast<unsigned char>(str[i]))) ++i;
      size_t start = i;
      while (i < str.size() && !std::isspace(static_cast<unsigned char>(str[i]))) ++i;
      if (i > start) out.push_back(str.substr(start, i - start));
    }
    return out;
  }

  fin_string trim() const
  {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return fin_string();
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
  }

  bool starts_with(const fin_string& prefix) const
  {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix.str) == 0;
  }

  bool ends_with(const fin_string& suffix) const
  {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix.str) == 0;
  }

  fin_string left(size_t count) const
  {
    return str.substr(0, count);
  }

  size_t count(const fin_string& substring) const
  {
    if (substring.empty()) return 0;
    size_t n = 0;
    size_t pos = 0;
    while ((pos = str.find(substring.str, pos)) != std::string::npos)
    {
      n++;
      pos += substring.size();
    }
    return n;
  }

  fin_string repeat(size_t times) const
  {
    fin_string result;
    for (size_t i = 0; i < times; ++i)
    {
      result += *this;
    }
    return result;
  }

  fin_string join(const std::vector<fin_string>& parts) const
  {
    if (parts.empty()) return fin_string();
    fin_string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i)
    {
      result += *this + parts[i];
    }
    return result;
  }

  std::vector<fin_string> lines() const
  {
    return split("\n");
  }

  fin_string normalize_whitespace() const
  {
    fin_string result;
    bool in_whitespace = false;
    for (char c : str)
    {
      if (std::isspace(static_cast<unsigned char>(c)))
      {
        if (!in_whitespace)
        {
          result += ' ';
          in_whitespace = true;
        }
      }
      else
      {
        result += c;
        in_whitespace = false;
      }
    }
    return result.trim();
  }
};

inline fin_string operator+(const char* lhs, const fin_string& rhs)
{
  return fin_string(lhs) + rhs;
}

inline std::ostream& operator<<(std::ostream& os, const fin_string& s)
{
  return os << s.to_std_const();
}

#endif // fin_STRING_H
