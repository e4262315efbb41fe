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

#include "pbrtscene.h"
#include "pbrtscene_internal.h"

#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <string>

#define PBRTSCENE_STATIC_ARRAY_LENGTH(arr)  static_cast<uint32_t>(sizeof(arr) / sizeof((arr)[0]))


namespace pbrtscene {

  //
  // Constants
  //

  static constexpr double kDoubleDigits[10] = { 0.0, 1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0 };

  // Numbers longer than this can't be valid int or float literals anyway.
  static constexpr size_t kMaxNumberLength = 63;

  // Longest piece of a token we'll quote back in an error message.
  static constexpr int kMaxQuotedTokenLength = 64;


  //
  // Directives
  //

  struct DirectiveDeclaration {
    DirectiveID id;
    const char* name;        // Name of the directive. This is what we will match against in the file.
    const char* argPattern;  // Each char is one argument: 'f' = float, 's' = quoted string, 'o' = optional quoted string, 'k' = bare or quoted keyword, 'p' = param list, 'P' = exactly one param.
  };


  // Must be in the same order as the DirectiveID enum.
  static const DirectiveDeclaration kDirectives[] = {
    // Transforms
    { DirectiveID::Identity,           "Identity",           ""                 },
    { DirectiveID::Translate,          "Translate",          "fff"              },
    { DirectiveID::Scale,              "Scale",              "fff"              },
    { DirectiveID::Rotate,             "Rotate",             "ffff"             },
    { DirectiveID::LookAt,             "LookAt",             "fffffffff"        },
    { DirectiveID::Transform,          "Transform",          "ffffffffffffffff" },
    { DirectiveID::ConcatTransform,    "ConcatTransform",    "ffffffffffffffff" },
    { DirectiveID::CoordinateSystem,   "CoordinateSystem",   "s"                },
    { DirectiveID::CoordSysTransform,  "CoordSysTransform",  "s"                },
    { DirectiveID::TransformBegin,     "TransformBegin",     ""                 },
    { DirectiveID::TransformEnd,       "TransformEnd",       ""                 },
    { DirectiveID::TransformTimes,     "TransformTimes",     "ff"               },
    { DirectiveID::ActiveTransform,    "ActiveTransform",    "k"                },
    // Scopes
    { DirectiveID::AttributeBegin,     "AttributeBegin",     ""                 },
    { DirectiveID::AttributeEnd,       "AttributeEnd",       ""                 },
    { DirectiveID::Attribute,          "Attribute",          "sp"               },
    { DirectiveID::WorldBegin,         "WorldBegin",         ""                 },
    { DirectiveID::ReverseOrientation, "ReverseOrientation", ""                 },
    { DirectiveID::ObjectBegin,        "ObjectBegin",        "s"                },
    { DirectiveID::ObjectEnd,          "ObjectEnd",          ""                 },
    { DirectiveID::ObjectInstance,     "ObjectInstance",     "s"                },
    // Resources
    { DirectiveID::Option,             "Option",             "P"                },
    { DirectiveID::ColorSpace,         "ColorSpace",         "s"                },
    { DirectiveID::Camera,             "Camera",             "sp"               },
    { DirectiveID::Film,               "Film",               "sp"               },
    { DirectiveID::Sampler,            "Sampler",            "sp"               },
    { DirectiveID::Integrator,         "Integrator",         "sp"               },
    { DirectiveID::Accelerator,        "Accelerator",        "sp"               },
    { DirectiveID::PixelFilter,        "PixelFilter",        "sp"               },
    { DirectiveID::Shape,              "Shape",              "sp"               },
    { DirectiveID::Material,           "Material",           "sp"               },
    { DirectiveID::MakeNamedMaterial,  "MakeNamedMaterial",  "sp"               },
    { DirectiveID::NamedMaterial,      "NamedMaterial",      "s"                },
    { DirectiveID::Texture,            "Texture",            "sssp"             },
    { DirectiveID::LightSource,        "LightSource",        "sp"               },
    { DirectiveID::AreaLightSource,    "AreaLightSource",    "sp"               },
    { DirectiveID::MakeNamedMedium,    "MakeNamedMedium",    "sp"               },
    { DirectiveID::MediumInterface,    "MediumInterface",    "so"               }, // A single name sets both sides.
    { DirectiveID::Include,            "Include",            "s"                },
    { DirectiveID::Import,             "Import",             "s"                },
  };
  static constexpr uint32_t kNumDirectives = PBRTSCENE_STATIC_ARRAY_LENGTH(kDirectives);


  //
  // Parameter types
  //

  struct ParamTypeDeclaration {
    ParamType type;
    const char* name;
    const char* alias;
    ParamStorage storage;
  };

  // Must be in the same order as the ParamType enum.
  static const ParamTypeDeclaration kParamTypes[] = {
    { ParamType::Bool,      "bool",      nullptr,  ParamStorage::Bools   },
    { ParamType::Int,       "integer",   nullptr,  ParamStorage::Ints    },
    { ParamType::Float,     "float",     nullptr,  ParamStorage::Floats  },
    { ParamType::Point2,    "point2",    nullptr,  ParamStorage::Floats  },
    { ParamType::Point3,    "point3",    "point",  ParamStorage::Floats  },
    { ParamType::Vector2,   "vector2",   nullptr,  ParamStorage::Floats  },
    { ParamType::Vector3,   "vector3",   "vector", ParamStorage::Floats  },
    { ParamType::Normal3,   "normal3",   "normal", ParamStorage::Floats  },
    { ParamType::Spectrum,  "spectrum",  nullptr,  ParamStorage::Floats  },
    { ParamType::RGB,       "rgb",       "color",  ParamStorage::Floats  },
    { ParamType::Blackbody, "blackbody", nullptr,  ParamStorage::Ints    },
    { ParamType::String,    "string",    nullptr,  ParamStorage::Strings },
    { ParamType::Texture,   "texture",   nullptr,  ParamStorage::Strings },
  };
  static constexpr uint32_t kNumParamTypes = PBRTSCENE_STATIC_ARRAY_LENGTH(kParamTypes);


  static const char* kErrorCodeNames[] = {
    "None",
    "InvalidToken",
    "UnknownDirective",
    "UnexpectedToken",
    "UnexpectedEOF",
    "InvalidString",
    "InvalidNumber",
    "InvalidBool",
    "DuplicateParam",
    "InvalidParamType",
    "InvalidParamName",
    "UnknownCoordinateSystem",
    "UnbalancedAttributes",
    "InvalidAttributeTarget",
    "UnknownObject",
    "NestedObject",
    "MissingWorldBegin",
    "MultipleWorldBegin",
    "UnknownType",
    "MissingParam",
    "InvalidParamValue",
    "UnknownTexture",
    "UnknownOption",
    "Unsupported",
    "IncludeDepth",
    "IOError",
  };
  static constexpr uint32_t kNumErrorCodes = PBRTSCENE_STATIC_ARRAY_LENGTH(kErrorCodeNames);


  //
  // Vec3 type
  //

  static inline Vec3 operator - (Vec3 lhs, Vec3 rhs) { return Vec3{ lhs.x - rhs.x, lhs.y - rhs.y, lhs.z - rhs.z }; }

  static inline float dot(Vec3 lhs, Vec3 rhs) { return lhs.x * rhs.x + lhs.y * rhs.y + lhs.z * rhs.z; }
  static inline float length(Vec3 v) { return std::sqrt(dot(v, v)); }
  static inline Vec3 normalize(Vec3 v) { float len = length(v); return Vec3{ v.x / len, v.y / len, v.z / len }; }
  static inline Vec3 cross(Vec3 lhs, Vec3 rhs) { return Vec3{ lhs.y * rhs.z - lhs.z * rhs.y, lhs.z * rhs.x - lhs.x * rhs.z, lhs.x * rhs.y - lhs.y * rhs.x }; }


  //
  // Internal-only functions
  //

  static inline bool is_whitespace(char ch)
  {
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
  }


  static inline bool is_line_end(char ch)
  {
    return ch == '\n' || ch == '\r';
  }


  // Chars which end a bare token.
  static inline bool is_bare_token_end(char ch)
  {
    return is_whitespace(ch) || ch == '"' || ch == '[' || ch == ']';
  }


  static inline bool is_digit(char ch)
  {
    return ch >= '0' && ch <= '9';
  }


  static inline bool is_letter(char ch)
  {
    ch |= 32; // upper and lower case letters differ only at this bit.
    return ch >= 'a' && ch <= 'z';
  }


  static inline bool is_alnum(char ch)
  {
    return is_digit(ch) || is_letter(ch);
  }


  static char* copy_string(const char* src)
  {
    if (src == nullptr) {
      return nullptr;
    }
    size_t len = std::strlen(src);
    char* dst = new char[len + 1];
    std::memcpy(dst, src, sizeof(char) * len);
    dst[len] = '\0';
    return dst;
  }


  static inline int quoted_length(size_t len)
  {
    return static_cast<int>(std::min(len, size_t(kMaxQuotedTokenLength)));
  }


  static bool int_literal(const char* start, char const** end, int* val)
  {
    const char* pos = start;

    bool negative = false;
    if (*pos == '-') {
      negative = true;
      ++pos;
    }
    else if (*pos == '+') {
      ++pos;
    }

    bool hasLeadingZeroes = *pos == '0';
    if (hasLeadingZeroes) {
      do {
        ++pos;
      } while (*pos == '0');
    }

    int numDigits = 0;
    int64_t localVal = 0;
    while (is_digit(*pos)) {
      localVal = localVal * 10 + static_cast<int64_t>(*pos - '0');
      ++numDigits;
      ++pos;
      if (numDigits > 10) {
        return false;
      }
    }

    if (numDigits == 0 && hasLeadingZeroes) {
      numDigits = 1;
    }

    if (numDigits == 0 || is_letter(*pos) || *pos == '_' || *pos == '.') {
      return false;
    }

    if (negative) {
      localVal = -localVal;
    }
    if (localVal < int64_t(std::numeric_limits<int>::min()) || localVal > int64_t(std::numeric_limits<int>::max())) {
      return false;
    }

    if (val != nullptr) {
      *val = static_cast<int>(localVal);
    }
    if (end != nullptr) {
      *end = pos;
    }
    return true;
  }


  static bool double_literal(const char* start, char const** end, double* val)
  {
    const char* pos = start;

    bool negative = false;
    if (*pos == '-') {
      negative = true;
      ++pos;
    }
    else if (*pos == '+') {
      ++pos;
    }

    double localVal = 0.0;

    bool hasIntDigits = is_digit(*pos);
    if (hasIntDigits) {
      do {
        localVal = localVal * 10.0 + kDoubleDigits[*pos - '0'];
        ++pos;
      } while (is_digit(*pos));
    }
    else if (*pos != '.') {
      return false;
    }

    bool hasFracDigits = false;
    if (*pos == '.') {
      ++pos;
      hasFracDigits = is_digit(*pos);
      if (hasFracDigits) {
        double scale = 0.1;
        do {
          localVal += scale * kDoubleDigits[*pos - '0'];
          scale *= 0.1;
          ++pos;
        } while (is_digit(*pos));
      }
      else if (!hasIntDigits) {
        return false; // no digits before or after the decimal point.
      }
    }

    bool hasExponent = *pos == 'e' || *pos == 'E';
    if (hasExponent) {
      ++pos;
      bool negativeExponent = false;
      if (*pos == '-') {
        negativeExponent = true;
        ++pos;
      }
      else if (*pos == '+') {
        ++pos;
      }

      if (!is_digit(*pos)) {
        return false; // exponent part has no digits.
      }

      double exponent = 0.0;
      do {
        exponent = exponent * 10.0 + kDoubleDigits[*pos - '0'];
        ++pos;
      } while (is_digit(*pos));

      if (val != nullptr) {
        if (negativeExponent) {
          exponent = -exponent;
        }
        localVal *= std::pow(10.0, exponent);
      }
    }

    if (*pos == '.' || *pos == '_' || is_alnum(*pos)) {
      return false; // trailing chars.
    }

    if (negative) {
      localVal = -localVal;
    }

    if (val != nullptr) {
      *val = localVal;
    }
    if (end != nullptr) {
      *end = pos;
    }
    return true;
  }


  static bool float_literal(const char* start, char const** end, float* val)
  {
    double tmp = 0.0;
    bool ok = double_literal(start, end, &tmp);
    if (ok && val != nullptr) {
      *val = static_cast<float>(tmp);
    }
    return ok;
  }


  // Copies the token into `buf` with a nul terminator, so the literal parsers
  // can't run past the end of the token.
  static bool number_text(const Token& tok, char buf[kMaxNumberLength + 1])
  {
    if (tok.len == 0 || tok.len > kMaxNumberLength) {
      return false;
    }
    std::memcpy(buf, tok.text, tok.len);
    buf[tok.len] = '\0';
    return true;
  }


  //
  // Shared internal functions
  //

  char* format_message(const char* fmt, va_list args)
  {
    va_list argsCopy;
    va_copy(argsCopy, args);
    int len = vsnprintf(nullptr, 0, fmt, argsCopy);
    va_end(argsCopy);

    if (len < 0) {
      return copy_string(fmt);
    }

    char* msg = new char[size_t(len + 1)];
    vsnprintf(msg, size_t(len + 1), fmt, args);
    return msg;
  }


  int find_string_in_array(const char* str, const char* arr[])
  {
    for (int i = 0; arr[i] != nullptr; i++) {
      if (std::strcmp(str, arr[i]) == 0) {
        return i;
      }
    }
    return -1;
  }


  // The length check comes first so a token with an embedded nul can't make
  // the comparison run past the end of `str`.
  bool matches_exactly(const char* text, size_t len, const char* str)
  {
    return std::strlen(str) == len && std::memcmp(text, str, len) == 0;
  }


  //
  // Public functions
  //

  const char* error_code_name(ErrorCode code)
  {
    uint32_t idx = static_cast<uint32_t>(code);
    return (idx < kNumErrorCodes) ? kErrorCodeNames[idx] : "Unknown";
  }


  const char* directive_name(DirectiveID id)
  {
    uint32_t idx = static_cast<uint32_t>(id);
    return (idx < kNumDirectives) ? kDirectives[idx].name : "";
  }


  bool find_directive(const char* keyword, size_t len, DirectiveID* id)
  {
    for (uint32_t i = 0; i < kNumDirectives; i++) {
      if (matches_exactly(keyword, len, kDirectives[i].name)) {
        if (id != nullptr) {
          *id = kDirectives[i].id;
        }
        return true;
      }
    }
    return false;
  }


  bool param_type_from_name(const char* name, size_t len, ParamType* type)
  {
    if (name == nullptr || len == 0) {
      return false;
    }
    for (uint32_t i = 0; i < kNumParamTypes; i++) {
      const ParamTypeDeclaration& decl = kParamTypes[i];
      bool match = matches_exactly(name, len, decl.name) ||
                   (decl.alias != nullptr && matches_exactly(name, len, decl.alias));
      if (match) {
        if (type != nullptr) {
          *type = decl.type;
        }
        return true;
      }
    }
    return false;
  }


  const char* param_type_name(ParamType type)
  {
    uint32_t idx = static_cast<uint32_t>(type);
    return (idx < kNumParamTypes) ? kParamTypes[idx].name : "";
  }


  ParamStorage param_storage(ParamType type)
  {
    uint32_t idx = static_cast<uint32_t>(type);
    return (idx < kNumParamTypes) ? kParamTypes[idx].storage : ParamStorage::Floats;
  }


  void find_line_and_column(const char* text, size_t len, size_t offset, int64_t* line, int64_t* column)
  {
    int64_t localLine = 1;
    int64_t newline = -1;

    size_t end = std::min(offset, len);
    for (size_t j = 0; j < end; j++) {
      if (text[j] == '\n') {
        ++localLine;
        newline = int64_t(j);
      }
    }
    *line = localLine;
    *column = int64_t(end) - newline;
  }


  //
  // Mat4 public methods
  //

  void Mat4::identity()
  {
    std::memset(rows, 0, sizeof(rows));
    rows[0][0] = rows[1][1] = rows[2][2] = rows[3][3] = 1.0f;
  }


  void Mat4::translate(Vec3 v)
  {
    rows[0][3] += rows[0][0] * v.x + rows[0][1] * v.y + rows[0][2] * v.z;
    rows[1][3] += rows[1][0] * v.x + rows[1][1] * v.y + rows[1][2] * v.z;
    rows[2][3] += rows[2][0] * v.x + rows[2][1] * v.y + rows[2][2] * v.z;
    rows[3][3] += rows[3][0] * v.x + rows[3][1] * v.y + rows[3][2] * v.z;
  }


  void Mat4::scale(Vec3 v)
  {
    rows[0][0] *= v.x;
    rows[0][1] *= v.y;
    rows[0][2] *= v.z;

    rows[1][0] *= v.x;
    rows[1][1] *= v.y;
    rows[1][2] *= v.z;

    rows[2][0] *= v.x;
    rows[2][1] *= v.y;
    rows[2][2] *= v.z;

    rows[3][0] *= v.x;
    rows[3][1] *= v.y;
    rows[3][2] *= v.z;
  }


  void Mat4::rotate(const float angleRadians, Vec3 axis)
  {
    float c = std::cos(angleRadians);
    float s = std::sin(angleRadians);

    Vec3 u = normalize(axis);

    float a[4][4];
    std::memcpy(a, rows, sizeof(a));

    float b[3][3] = {
      { u.x * u.x * (1.0f - c) + c,        u.x * u.y * (1.0f - c) - u.z * s,  u.x * u.z * (1.0f - c) + u.y * s },
      { u.y * u.x * (1.0f - c) + u.z * s,  u.y * u.y * (1.0f - c) + c,        u.y * u.z * (1.0f - c) - u.x * s },
      { u.z * u.x * (1.0f - c) - u.y * s,  u.z * u.y * (1.0f - c) + u.x * s,  u.z * u.z * (1.0f - c) + c       },
    };

    for (int r = 0; r < 4; r++) {
      for (int col = 0; col < 3; col++) {
        rows[r][col] = a[r][0] * b[0][col] + a[r][1] * b[1][col] + a[r][2] * b[2][col];
      }
    }
  }


  void Mat4::lookAt(Vec3 pos, Vec3 target, Vec3 up)
  {
    Vec3 dir = normalize(target - pos);
    Vec3 xAxis = normalize(cross(normalize(up), dir));
    Vec3 yAxis = cross(dir, xAxis);

    // Camera to world first, then invert it to get the look-at matrix.
    Mat4 m;
    m.rows[0][0] = xAxis.x;
    m.rows[1][0] = xAxis.y;
    m.rows[2][0] = xAxis.z;
    m.rows[3][0] = 0.0f;

    m.rows[0][1] = yAxis.x;
    m.rows[1][1] = yAxis.y;
    m.rows[2][1] = yAxis.z;
    m.rows[3][1] = 0.0f;

    m.rows[0][2] = dir.x;
    m.rows[1][2] = dir.y;
    m.rows[2][2] = dir.z;
    m.rows[3][2] = 0.0f;

    m.rows[0][3] = pos.x;
    m.rows[1][3] = pos.y;
    m.rows[2][3] = pos.z;
    m.rows[3][3] = 1.0f;

    concatTransform(inverse(m));
  }


  void Mat4::concatTransform(const Mat4& m)
  {
    float a[4][4];
    std::memcpy(a, rows, sizeof(a));

    for (int r = 0; r < 4; r++) {
      for (int c = 0; c < 4; c++) {
        rows[r][c] = a[r][0] * m.rows[0][c] + a[r][1] * m.rows[1][c] + a[r][2] * m.rows[2][c] + a[r][3] * m.rows[3][c];
      }
    }
  }


  void Mat4::set_column_major(const float vals[16])
  {
    for (int i = 0; i < 16; i++) {
      rows[i % 4][i / 4] = vals[i];
    }
  }


  // Determinant of the 2x2 matrix formed from rows r0,r1 and columns c0,c1 of
  // a 4x4 matrix. This is a helper method used for calculating the inverse of
  // the 4x4 matrix.
  float Mat4::det2x2(int r0, int r1, int c0, int c1) const
  {
    return rows[r0][c0] * rows[r1][c1] - rows[r0][c1] * rows[r1][c0];
  }


  Mat4 Mat4::identity_matrix()
  {
    Mat4 m;
    m.identity();
    return m;
  }


  Mat4 inverse(const Mat4& m)
  {
    float A = m.det2x2(2, 3, 2, 3);
    float B = m.det2x2(2, 3, 1, 3);
    float C = m.det2x2(2, 3, 1, 2);
    float D = m.det2x2(2, 3, 0, 3);
    float E = m.det2x2(2, 3, 0, 2);
    float F = m.det2x2(2, 3, 0, 1);
    float G = m.det2x2(1, 3, 2, 3);
    float H = m.det2x2(1, 3, 1, 3);
    float I = m.det2x2(1, 3, 1, 2);
    float J = m.det2x2(1, 3, 0, 3);
    float K = m.det2x2(1, 3, 0, 2);
    float L = m.det2x2(1, 3, 0, 1);
    float M = m.det2x2(1, 2, 2, 3);
    float N = m.det2x2(1, 2, 1, 3);
    float O = m.det2x2(1, 2, 1, 2);
    float P = m.det2x2(1, 2, 0, 3);
    float Q = m.det2x2(1, 2, 0, 2);
    float R = m.det2x2(1, 2, 0, 1);

    Mat4 inv;

    inv.rows[0][0] = +(m.rows[1][1] * A - m.rows[1][2] * B + m.rows[1][3] * C);
    inv.rows[0][1] = -(m.rows[0][1] * A - m.rows[0][2] * B + m.rows[0][3] * C);
    inv.rows[0][2] = +(m.rows[0][1] * G - m.rows[0][2] * H + m.rows[0][3] * I);
    inv.rows[0][3] = -(m.rows[0][1] * M - m.rows[0][2] * N + m.rows[0][3] * O);

    inv.rows[1][0] = -(m.rows[1][0] * A - m.rows[1][2] * D + m.rows[1][3] * E);
    inv.rows[1][1] = +(m.rows[0][0] * A - m.rows[0][2] * D + m.rows[0][3] * E);
    inv.rows[1][2] = -(m.rows[0][0] * G - m.rows[0][2] * J + m.rows[0][3] * K);
    inv.rows[1][3] = +(m.rows[0][0] * M - m.rows[0][2] * P + m.rows[0][3] * Q);

    inv.rows[2][0] = +(m.rows[1][0] * B - m.rows[1][1] * D + m.rows[1][3] * F);
    inv.rows[2][1] = -(m.rows[0][0] * B - m.rows[0][1] * D + m.rows[0][3] * F);
    inv.rows[2][2] = +(m.rows[0][0] * H - m.rows[0][1] * J + m.rows[0][3] * L);
    inv.rows[2][3] = -(m.rows[0][0] * N - m.rows[0][1] * P + m.rows[0][3] * R);

    inv.rows[3][0] = -(m.rows[1][0] * C - m.rows[1][1] * E + m.rows[1][2] * F);
    inv.rows[3][1] = +(m.rows[0][0] * C - m.rows[0][1] * E + m.rows[0][2] * F);
    inv.rows[3][2] = -(m.rows[0][0] * I - m.rows[0][1] * K + m.rows[0][2] * L);
    inv.rows[3][3] = +(m.rows[0][0] * O - m.rows[0][1] * Q + m.rows[0][2] * R);

    float det = m.rows[0][0] * inv.rows[0][0] +
                m.rows[0][1] * inv.rows[1][0] +
                m.rows[0][2] * inv.rows[2][0] +
                m.rows[0][3] * inv.rows[3][0];
    float invDet = 1.0f / det;

    for (int r = 0; r < 4; r++) {
      for (int c = 0; c < 4; c++) {
        inv.rows[r][c] *= invDet;
      }
    }

    return inv;
  }


  //
  // Token public methods
  //

  Token::Token(const char* theText) :
    text(theText),
    len(theText != nullptr ? std::strlen(theText) : 0),
    offset(0)
  {
  }


  TokenKind Token::kind() const
  {
    if (len == 0) {
      return TokenKind::Bare;
    }
    switch (text[0]) {
    case '[': return (len == 1) ? TokenKind::OpenBracket : TokenKind::Bare;
    case ']': return (len == 1) ? TokenKind::CloseBracket : TokenKind::Bare;
    case '"': return TokenKind::String;
    case '#': return TokenKind::Comment;
    default:  return TokenKind::Bare;
    }
  }


  bool Token::is_valid() const
  {
    if (len == 0) {
      return false;
    }

    bool startsWithQuote = text[0] == '"';
    bool endsWithQuote = text[len - 1] == '"';
    if (startsWithQuote || endsWithQuote) {
      if (startsWithQuote != endsWithQuote || len < 2) {
        return false;
      }
    }

    if (!startsWithQuote && std::memchr(text, ' ', len) != nullptr) {
      return false;
    }
    return true;
  }


  bool Token::is_quoted() const
  {
    return len > 0 && text[0] == '"';
  }


  bool Token::is_open_bracket() const
  {
    return kind() == TokenKind::OpenBracket;
  }


  bool Token::is_close_bracket() const
  {
    return kind() == TokenKind::CloseBracket;
  }


  bool Token::is_comment() const
  {
    return kind() == TokenKind::Comment;
  }


  bool Token::is_directive() const
  {
    return kind() == TokenKind::Bare && find_directive(text, len, nullptr);
  }


  bool Token::equals(const char* str) const
  {
    return matches_exactly(text, len, str);
  }


  std::string Token::str() const
  {
    return std::string(text, len);
  }


  bool Token::to_float(float* val) const
  {
    char buf[kMaxNumberLength + 1];
    if (!number_text(*this, buf)) {
      return false;
    }
    const char* end = nullptr;
    return float_literal(buf, &end, val) && end == buf + len;
  }


  bool Token::to_int(int* val) const
  {
    char buf[kMaxNumberLength + 1];
    if (!number_text(*this, buf)) {
      return false;
    }
    const char* end = nullptr;
    return int_literal(buf, &end, val) && end == buf + len;
  }


  bool Token::to_bool(bool* val) const
  {
    // Older exporters write quoted bools.
    if (equals("true") || equals("\"true\"")) {
      *val = true;
      return true;
    }
    else if (equals("false") || equals("\"false\"")) {
      *val = false;
      return true;
    }
    return false;
  }


  bool Token::unquote(std::string* dest) const
  {
    if (len < 2 || text[0] != '"' || text[len - 1] != '"') {
      return false;
    }
    dest->assign(text + 1, len - 2);
    return true;
  }


  //
  // Tokenizer public methods
  //

  Tokenizer::Tokenizer(const char* text, size_t len) :
    m_text(text),
    m_len(text != nullptr ? len : 0)
  {
  }


  void Tokenizer::set_skip_comments(bool skip)
  {
    m_skipComments = skip;
  }


  bool Tokenizer::next(Token* tok)
  {
    size_t end = m_len;
    bool found = scan(m_pos, tok, &end);
    m_pos = end;
    return found;
  }


  bool Tokenizer::peek(Token* tok)
  {
    size_t end;
    return scan(m_pos, tok, &end);
  }


  size_t Tokenizer::offset() const
  {
    return m_pos;
  }


  const char* Tokenizer::text() const
  {
    return m_text;
  }


  size_t Tokenizer::length() const
  {
    return m_len;
  }


  //
  // Tokenizer private methods
  //

  bool Tokenizer::scan(size_t pos, Token* tok, size_t* endPos) const
  {
    while (pos < m_len) {
      char ch = m_text[pos];
      if (is_whitespace(ch)) {
        ++pos;
        continue;
      }

      size_t start = pos;
      if (ch == '[' || ch == ']') {
        ++pos;
      }
      else if (ch == '"') {
        // No escapes. An unterminated string runs to the end of the input.
        ++pos;
        while (pos < m_len && m_text[pos] != '"') {
          ++pos;
        }
        if (pos < m_len) {
          ++pos;
        }
      }
      else if (ch == '#') {
        while (pos < m_len && !is_line_end(m_text[pos])) {
          ++pos;
        }
        if (m_skipComments) {
          continue;
        }
      }
      else {
        while (pos < m_len && !is_bare_token_end(m_text[pos])) {
          ++pos;
        }
      }

      tok->text = m_text + start;
      tok->len = pos - start;
      tok->offset = start;
      *endPos = pos;
      return true;
    }

    *endPos = m_len;
    return false;
  }


  //
  // Param public methods
  //

  Param::Param()
  {
  }


  Param::Param(const std::string& theName, ParamType theType) :
    m_name(theName),
    m_type(theType),
    m_storage(param_storage(theType))
  {
  }


  const std::string& Param::name() const
  {
    return m_name;
  }


  ParamType Param::type() const
  {
    return m_type;
  }


  ParamStorage Param::storage() const
  {
    return m_storage;
  }


  uint32_t Param::count() const
  {
    switch (m_storage) {
    case ParamStorage::Floats:  return static_cast<uint32_t>(m_floats.size());
    case ParamStorage::Ints:    return static_cast<uint32_t>(m_ints.size());
    case ParamStorage::Strings: return static_cast<uint32_t>(m_strings.size());
    case ParamStorage::Bools:   return static_cast<uint32_t>(m_bools.size());
    }
    return 0;
  }


  bool Param::add_float(float val)
  {
    if (m_storage != ParamStorage::Floats) {
      return false;
    }
    m_floats.push_back(val);
    return true;
  }


  bool Param::add_int(int val)
  {
    if (m_storage != ParamStorage::Ints) {
      return false;
    }
    m_ints.push_back(val);
    return true;
  }


  bool Param::add_string(const std::string& val)
  {
    if (m_storage != ParamStorage::Strings) {
      return false;
    }
    m_strings.push_back(val);
    return true;
  }


  bool Param::add_bool(bool val)
  {
    if (m_storage != ParamStorage::Bools) {
      return false;
    }
    m_bools.push_back(val);
    return true;
  }


  const std::vector<float>* Param::floats() const
  {
    return (m_storage == ParamStorage::Floats) ? &m_floats : nullptr;
  }


  const std::vector<int>* Param::ints() const
  {
    return (m_storage == ParamStorage::Ints) ? &m_ints : nullptr;
  }


  const std::vector<std::string>* Param::strings() const
  {
    return (m_storage == ParamStorage::Strings) ? &m_strings : nullptr;
  }


  const std::vector<bool>* Param::bools() const
  {
    return (m_storage == ParamStorage::Bools) ? &m_bools : nullptr;
  }


  bool Param::spectrum(Spectrum* dest) const
  {
    switch (m_type) {
    case ParamType::RGB:
      if (m_floats.size() != 3) {
        return false;
      }
      *dest = rgb_spectrum(m_floats[0], m_floats[1], m_floats[2]);
      return true;

    case ParamType::Blackbody:
      if (m_ints.empty()) {
        return false;
      }
      *dest = blackbody_spectrum(m_ints[0]);
      return true;

    default:
      return false;
    }
  }


  //
  // ParamList public methods
  //

  bool ParamList::add(const Param& param)
  {
    if (m_params.find(param.name()) != m_params.end()) {
      return false;
    }
    m_params[param.name()] = param;
    return true;
  }


  void ParamList::merge(const ParamList& other)
  {
    for (const auto& entry : other.m_params) {
      m_params[entry.first] = entry.second;
    }
  }


  void ParamList::clear()
  {
    m_params.clear();
  }


  size_t ParamList::size() const
  {
    return m_params.size();
  }


  bool ParamList::empty() const
  {
    return m_params.empty();
  }


  const Param* ParamList::find(const char* name) const
  {
    auto it = m_params.find(name);
    return (it != m_params.end()) ? &it->second : nullptr;
  }


  const std::vector<float>* ParamList::floats(const char* name) const
  {
    const Param* param = find(name);
    return (param != nullptr) ? param->floats() : nullptr;
  }


  const std::vector<int>* ParamList::ints(const char* name) const
  {
    const Param* param = find(name);
    return (param != nullptr) ? param->ints() : nullptr;
  }


  const std::vector<std::string>* ParamList::strings(const char* name) const
  {
    const Param* param = find(name);
    return (param != nullptr) ? param->strings() : nullptr;
  }


  const std::vector<bool>* ParamList::bools(const char* name) const
  {
    const Param* param = find(name);
    return (param != nullptr) ? param->bools() : nullptr;
  }


  float ParamList::float_value(const char* name, float defaultVal) const
  {
    const std::vector<float>* vals = floats(name);
    return (vals != nullptr && !vals->empty()) ? vals->front() : defaultVal;
  }


  int ParamList::int_value(const char* name, int defaultVal) const
  {
    const std::vector<int>* vals = ints(name);
    return (vals != nullptr && !vals->empty()) ? vals->front() : defaultVal;
  }


  bool ParamList::bool_value(const char* name, bool defaultVal) const
  {
    const std::vector<bool>* vals = bools(name);
    return (vals != nullptr && !vals->empty()) ? bool(vals->front()) : defaultVal;
  }


  const char* ParamList::string_value(const char* name, const char* defaultVal) const
  {
    const std::vector<std::string>* vals = strings(name);
    return (vals != nullptr && !vals->empty()) ? vals->front().c_str() : defaultVal;
  }


  bool ParamList::spectrum(const char* name, Spectrum* dest) const
  {
    const Param* param = find(name);
    return param != nullptr && param->spectrum(dest);
  }


  //
  // Directive public methods
  //

  void Directive::clear()
  {
    id = DirectiveID::Identity;
    offset = 0;
    numFloats = 0;
    for (uint32_t i = 0; i < numStrings; i++) {
      strings[i].clear();
    }
    numStrings = 0;
    params.clear();
    option = Param();
  }


  //
  // Error public methods
  //

  Error::Error(ErrorCode theCode, const char* theFilename, int64_t theOffset, const char* theMessage)
  {
    m_code = theCode;
    m_filename = copy_string(theFilename != nullptr ? theFilename : "");
    m_offset = theOffset;
    m_message = copy_string(theMessage != nullptr ? theMessage : "");
  }


  Error::~Error()
  {
    delete[] m_filename;
    delete[] m_message;
  }


  ErrorCode Error::code() const
  {
    return m_code;
  }


  const char* Error::filename() const
  {
    return m_filename;
  }


  const char* Error::message() const
  {
    return m_message;
  }


  int64_t Error::offset() const
  {
    return m_offset;
  }


  int64_t Error::line() const
  {
    return m_line;
  }


  int64_t Error::column() const
  {
    return m_column;
  }


  bool Error::has_line_and_column() const
  {
    return m_line > 0 && m_column > 0;
  }


  void Error::set_line_and_column(int64_t theLine, int64_t theColumn)
  {
    m_line = theLine;
    m_column = theColumn;
  }


  int Error::compare(const Error& rhs) const
  {
    int tmp = std::strcmp(m_filename, rhs.m_filename);
    if (tmp != 0) {
      return tmp;
    }
    if (m_offset != rhs.m_offset) {
      return (m_offset < rhs.m_offset) ? 1 : -1;
    }
    return 0;
  }


  //
  // DirectiveParser public methods
  //

  DirectiveParser::DirectiveParser(const char* text, size_t len, const char* filename) :
    m_tokenizer(text, len),
    m_filename(filename != nullptr ? filename : "")
  {
    m_tokenizer.set_skip_comments(true);
  }


  DirectiveParser::~DirectiveParser()
  {
    delete m_error;
  }


  bool DirectiveParser::next_directive(Directive* directive)
  {
    if (has_error()) {
      return false;
    }

    directive->clear();

    Token tok;
    if (!m_tokenizer.next(&tok)) {
      return false; // End of input between directives isn't an error.
    }

    directive->offset = tok.offset;
    if (!tok.is_valid()) {
      set_error(ErrorCode::InvalidToken, tok.offset, "Invalid token %.*s", quoted_length(tok.len), tok.text);
      return false;
    }
    if (tok.is_open_bracket() || tok.is_close_bracket()) {
      set_error(ErrorCode::UnexpectedToken, tok.offset, "Unexpected '%c', expected a directive", tok.text[0]);
      return false;
    }

    DirectiveID id;
    if (tok.kind() != TokenKind::Bare || !find_directive(tok.text, tok.len, &id)) {
      set_error(ErrorCode::UnknownDirective, tok.offset, "Unknown directive %.*s", quoted_length(tok.len), tok.text);
      return false;
    }
    directive->id = id;

    const DirectiveDeclaration& decl = kDirectives[static_cast<uint32_t>(id)];
    bool ok = true;
    for (const char* fmt = decl.argPattern; *fmt != '\0' && ok; ++fmt) {
      switch (*fmt) {
      case 'f':
        {
          uint32_t n = 1;
          while (fmt[n] == 'f') {
            ++n;
          }
          ok = parse_floats(n, directive);
          fmt += n - 1;
        }
        break;

      case 's':
        ok = parse_string(directive);
        break;

      case 'o':
        if (m_tokenizer.peek(&tok) && tok.is_quoted()) {
          ok = parse_string(directive);
        }
        break;

      case 'k':
        ok = parse_keyword(directive);
        break;

      case 'p':
        ok = parse_params(&directive->params);
        break;

      case 'P':
        ok = parse_param(&directive->option);
        break;

      default:
        break;
      }
    }

    return ok;
  }


  const char* DirectiveParser::filename() const
  {
    return m_filename.c_str();
  }


  const char* DirectiveParser::text() const
  {
    return m_tokenizer.text();
  }


  size_t DirectiveParser::length() const
  {
    return m_tokenizer.length();
  }


  void DirectiveParser::set_error(ErrorCode code, size_t offset, const char* fmt, ...)
  {
    if (has_error()) {
      return;
    }

    va_list args;
    va_start(args, fmt);
    char* errorMessage = format_message(fmt, args);
    va_end(args);

    m_error = new Error(code, m_filename.c_str(), int64_t(offset), errorMessage);
    delete[] errorMessage;

    int64_t errorLine, errorCol;
    find_line_and_column(m_tokenizer.text(), m_tokenizer.length(), offset, &errorLine, &errorCol);
    m_error->set_line_and_column(errorLine, errorCol);
  }


  bool DirectiveParser::has_error() const
  {
    return m_error != nullptr;
  }


  const Error* DirectiveParser::error() const
  {
    return m_error;
  }


  Error* DirectiveParser::take_error()
  {
    Error* err = m_error;
    m_error = nullptr;
    return err;
  }


  //
  // DirectiveParser private methods
  //

  bool DirectiveParser::read_token(Token* tok, const char* what)
  {
    if (!m_tokenizer.next(tok)) {
      set_error(ErrorCode::UnexpectedEOF, m_tokenizer.length(), "Unexpected end of file, expected %s", what);
      return false;
    }
    if (!tok->is_valid()) {
      set_error(ErrorCode::InvalidToken, tok->offset, "Invalid token %.*s", quoted_length(tok->len), tok->text);
      return false;
    }
    return true;
  }


  bool DirectiveParser::parse_floats(uint32_t n, Directive* directive)
  {
    Token tok;
    bool bracketed = m_tokenizer.peek(&tok) && tok.is_open_bracket();
    if (bracketed) {
      m_tokenizer.next(&tok);
    }

    for (uint32_t i = 0; i < n; i++) {
      if (!read_token(&tok, "a number")) {
        return false;
      }
      if (tok.is_open_bracket() || tok.is_close_bracket()) {
        set_error(ErrorCode::UnexpectedToken, tok.offset, "Unexpected '%c', %s needs %u numbers",
                  tok.text[0], directive_name(directive->id), n);
        return false;
      }
      if (!tok.to_float(&directive->floats[directive->numFloats])) {
        set_error(ErrorCode::InvalidNumber, tok.offset, "Invalid number %.*s", quoted_length(tok.len), tok.text);
        return false;
      }
      ++directive->numFloats;
    }

    if (bracketed) {
      if (!read_token(&tok, "']'")) {
        return false;
      }
      if (!tok.is_close_bracket()) {
        set_error(ErrorCode::UnexpectedToken, tok.offset, "Expected ']' after %u numbers for %s",
                  n, directive_name(directive->id));
        return false;
      }
    }
    return true;
  }


  bool DirectiveParser::parse_string(Directive* directive)
  {
    Token tok;
    if (!read_token(&tok, "a quoted string")) {
      return false;
    }
    if (directive->numStrings >= 3 || !tok.unquote(&directive->strings[directive->numStrings])) {
      set_error(ErrorCode::InvalidString, tok.offset, "Expected a quoted string but got %.*s", quoted_length(tok.len), tok.text);
      return false;
    }
    ++directive->numStrings;
    return true;
  }


  bool DirectiveParser::parse_keyword(Directive* directive)
  {
    Token tok;
    if (!read_token(&tok, "a keyword")) {
      return false;
    }
    if (tok.is_quoted()) {
      tok.unquote(&directive->strings[directive->numStrings]);
    }
    else if (tok.kind() == TokenKind::Bare) {
      directive->strings[directive->numStrings] = tok.str();
    }
    else {
      set_error(ErrorCode::UnexpectedToken, tok.offset, "Unexpected '%c', expected a keyword", tok.text[0]);
      return false;
    }
    ++directive->numStrings;
    return true;
  }


  bool DirectiveParser::parse_params(ParamList* params)
  {
    Token tok;
    while (m_tokenizer.peek(&tok) && tok.is_quoted()) {
      Param param;
      if (!parse_param(&param)) {
        return false;
      }
      if (!params->add(param)) {
        set_error(ErrorCode::DuplicateParam, tok.offset, "Duplicate parameter \"%s\"", param.name().c_str());
        return false;
      }
    }
    return true;
  }


  bool DirectiveParser::parse_param(Param* param)
  {
    Token header;
    if (!read_token(&header, "a parameter declaration")) {
      return false;
    }

    std::string decl;
    if (!header.unquote(&decl)) {
      set_error(ErrorCode::InvalidString, header.offset, "Expected a quoted parameter declaration but got %.*s",
                quoted_length(header.len), header.text);
      return false;
    }

    // Split "type name" on whitespace.
    size_t pos = 0;
    while (pos < decl.size() && is_whitespace(decl[pos])) {
      ++pos;
    }
    size_t typeStart = pos;
    while (pos < decl.size() && !is_whitespace(decl[pos])) {
      ++pos;
    }
    size_t typeEnd = pos;
    while (pos < decl.size() && is_whitespace(decl[pos])) {
      ++pos;
    }
    size_t nameStart = pos;
    while (pos < decl.size() && !is_whitespace(decl[pos])) {
      ++pos;
    }
    size_t nameEnd = pos;

    if (typeStart == typeEnd) {
      set_error(ErrorCode::InvalidParamName, header.offset, "Empty parameter declaration");
      return false;
    }

    ParamType type;
    if (!param_type_from_name(decl.c_str() + typeStart, typeEnd - typeStart, &type)) {
      set_error(ErrorCode::InvalidParamType, header.offset, "Unknown parameter type \"%.*s\"",
                quoted_length(typeEnd - typeStart), decl.c_str() + typeStart);
      return false;
    }
    if (nameStart == nameEnd) {
      set_error(ErrorCode::InvalidParamName, header.offset, "Parameter declaration \"%s\" has no name", decl.c_str());
      return false;
    }

    *param = Param(decl.substr(nameStart, nameEnd - nameStart), type);

    // Either a single value or a bracketed list.
    Token tok;
    if (!read_token(&tok, "a parameter value")) {
      return false;
    }
    if (tok.is_close_bracket()) {
      set_error(ErrorCode::UnexpectedToken, tok.offset, "Unexpected ']' for parameter \"%s\"", param->name().c_str());
      return false;
    }
    if (!tok.is_open_bracket()) {
      return parse_value(tok, param);
    }

    while (true) {
      if (!read_token(&tok, "']'")) {
        return false;
      }
      if (tok.is_close_bracket()) {
        break;
      }
      if (tok.is_open_bracket() || tok.is_directive()) {
        set_error(ErrorCode::UnexpectedToken, tok.offset, "Unexpected %.*s in the values for parameter \"%s\", missing ']'?",
                  quoted_length(tok.len), tok.text, param->name().c_str());
        return false;
      }
      if (!parse_value(tok, param)) {
        return false;
      }
    }
    return true;
  }


  bool DirectiveParser::parse_value(const Token& tok, Param* param)
  {
    switch (param->storage()) {
    case ParamStorage::Floats:
      {
        float val;
        if (!tok.to_float(&val)) {
          set_error(ErrorCode::InvalidNumber, tok.offset, "Invalid number %.*s for parameter \"%s\"",
                    quoted_length(tok.len), tok.text, param->name().c_str());
          return false;
        }
        param->add_float(val);
      }
      break;

    case ParamStorage::Ints:
      {
        int val;
        bool ok = tok.to_int(&val);
        if (!ok && param->type() == ParamType::Blackbody) {
          // Temperatures are often written with a decimal point.
          float tmp;
          ok = tok.to_float(&tmp);
          if (ok) {
            val = static_cast<int>(std::floor(tmp + 0.5f));
          }
        }
        if (!ok) {
          set_error(ErrorCode::InvalidNumber, tok.offset, "Invalid integer %.*s for parameter \"%s\"",
                    quoted_length(tok.len), tok.text, param->name().c_str());
          return false;
        }
        param->add_int(val);
      }
      break;

    case ParamStorage::Strings:
      {
        std::string val;
        if (!tok.unquote(&val)) {
          set_error(ErrorCode::InvalidString, tok.offset, "Expected a quoted string for parameter \"%s\" but got %.*s",
                    param->name().c_str(), quoted_length(tok.len), tok.text);
          return false;
        }
        param->add_string(val);
      }
      break;

    case ParamStorage::Bools:
      {
        bool val;
        if (!tok.to_bool(&val)) {
          set_error(ErrorCode::InvalidBool, tok.offset, "Expected true or false for parameter \"%s\" but got %.*s",
                    param->name().c_str(), quoted_length(tok.len), tok.text);
          return false;
        }
        param->add_bool(val);
      }
      break;
    }
    return true;
  }


  //
  // Scene public methods
  //

  Scene::Scene()
  {
  }


  Scene::~Scene()
  {
    delete accelerator;
    delete camera;
    delete film;
    delete filter;
    delete integrator;
    delete sampler;

    for (Shape* shape : shapes) {
      delete shape;
    }
    for (Object* object : objects) {
      delete object;
    }
    for (Instance* instance : instances) {
      delete instance;
    }
    for (Light* light : lights) {
      delete light;
    }
    for (AreaLight* areaLight : areaLights) {
      delete areaLight;
    }
    for (Material* material : materials) {
      delete material;
    }
    for (Texture* texture : textures) {
      delete texture;
    }
    for (Medium* medium : mediums) {
      delete medium;
    }
  }

} // namespace pbrtscene
