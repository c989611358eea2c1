#ifndef MISC_H_INCLUDED
#define MISC_H_INCLUDED

#include <string>
#include <vector>

typedef std::string::size_type string_size;
typedef std::vector<std::string> string_array;

class tribool {
public:
  tribool() {}
  tribool(bool value) : _M_VALUE(value ? 3 : 1) {}

  bool is_undef() const { return _M_VALUE == 0; }
  bool get(bool def_value = false) const {
    return is_undef() ? def_value : _M_VALUE > 1;
  }

private:
  char _M_VALUE = 0;
};

std::string trim(const std::string &str);
std::string toLower(const std::string &str);
string_array split(const std::string &s, const std::string &seperator);
std::string join(const string_array &arr, const std::string &delimiter);
bool startsWith(const std::string &hay, const std::string &needle);
bool endsWith(const std::string &hay, const std::string &needle);
bool strFind(const std::string &str, const std::string &target);
int to_int(const std::string &str, int def_value = 0);
bool isNumeric(const std::string &str);

std::string base64_encode(const std::string &string_to_encode);
bool base64_decode(const std::string &encoded_string, std::string &out);
std::string UrlEncode(const std::string &str);

bool regMatch(const std::string &src, const std::string &match);

bool fileExist(const std::string &path);
std::string fileGet(const std::string &path);
int fileWrite(const std::string &path, const std::string &content,
              bool overwrite);

#endif // MISC_H_INCLUDED
