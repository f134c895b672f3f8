#include "respress/http-headers.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

#include "respress/string-equal-ignore-case.hpp"
#include "respress/string-trim.hpp"

namespace respress {

HttpHeaders::HttpHeaders(std::initializer_list<http::HeaderView> headers) {
  _fields.reserve(headers.size());
  for (const auto &header : headers) {
    addHeader(header.name, header.value);
  }
}

HttpHeaders &HttpHeaders::addHeader(std::string_view name, std::string_view value) {
  _fields.emplace_back(std::string(name), std::string(TrimOws(value)));
  return *this;
}

HttpHeaders &HttpHeaders::header(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_fields, [name](const Field &field) { return CaseInsensitiveEqual(field.name, name); });
  if (it == _fields.end()) {
    return addHeader(name, value);
  }
  it->value.assign(TrimOws(value));
  auto duplicates = std::remove_if(std::next(it), _fields.end(),
                                   [name](const Field &field) { return CaseInsensitiveEqual(field.name, name); });
  _fields.erase(duplicates, _fields.end());
  return *this;
}

HttpHeaders &HttpHeaders::appendHeaderValue(std::string_view name, std::string_view value,
                                            std::string_view separator) {
  auto it = std::ranges::find_if(_fields, [name](const Field &field) { return CaseInsensitiveEqual(field.name, name); });
  if (it == _fields.end()) {
    return addHeader(name, value);
  }
  value = TrimOws(value);
  if (it->value.empty()) {
    it->value.assign(value);
  } else {
    it->value.append(separator);
    it->value.append(value);
  }
  return *this;
}

std::size_t HttpHeaders::removeHeader(std::string_view name) {
  return std::erase_if(_fields, [name](const Field &field) { return CaseInsensitiveEqual(field.name, name); });
}

std::optional<std::string_view> HttpHeaders::headerValue(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(_fields, [name](const Field &field) { return CaseInsensitiveEqual(field.name, name); });
  if (it == _fields.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

std::string HttpHeaders::combinedValue(std::string_view name) const {
  std::string ret;
  for (const auto &field : _fields) {
    if (CaseInsensitiveEqual(field.name, name)) {
      if (!ret.empty()) {
        ret.append(", ");
      }
      ret.append(field.value);
    }
  }
  return ret;
}

std::size_t HttpHeaders::count(std::string_view name) const noexcept {
  return static_cast<std::size_t>(
      std::ranges::count_if(_fields, [name](const Field &field) { return CaseInsensitiveEqual(field.name, name); }));
}

}  // namespace respress
