#ifndef PBRTSCENE_INTERNAL_H
#define PBRTSCENE_INTERNAL_H

/*
MIT License

Copyright (c) 2019 Vilya Harvey

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

// Helpers shared by the library sources. Not part of the public API.

#include <cstdarg>
#include <cstddef>

namespace pbrtscene {

  /// Formats a message into a new[]-allocated string which the caller must
  /// delete[]. Falls back to a copy of `fmt` if formatting fails.
  char* format_message(const char* fmt, va_list args);

  /// Index of `str` in a nullptr-terminated array, or -1.
  int find_string_in_array(const char* str, const char* arr[]);

  /// True if the `len` chars at `text` are exactly the nul-terminated `str`.
  bool matches_exactly(const char* text, size_t len, const char* str);


  /// Name for an enum value from a nullptr-terminated array in enum order,
  /// or an empty string if the value is out of range.
  template <class T, size_t N>
  const char* name_in_array(const char* (&names)[N], T value)
  {
    size_t idx = static_cast<size_t>(value);
    return (idx + 1 < N) ? names[idx] : "";
  }

} // namespace pbrtscene

#endif // PBRTSCENE_INTERNAL_H
