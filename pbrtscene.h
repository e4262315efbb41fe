#ifndef PBRTSCENE_H
#define PBRTSCENE_H

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

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>


/// pbrtscene - A parser and scene builder for PBRT v4 files
/// =======================================================
///
/// For info about the PBRT file format, see:
/// https://pbrt.org/fileformat-v4
///
/// Loading a file
/// --------------
/// ```
/// pbrtscene::Loader loader;
/// if (loader.load(filename)) {
///   pbrtscene::Scene* scene = loader.take_scene();
///   // ... process the scene, then delete it ...
///   delete scene;
/// }
/// else {
///   const pbrtscene::Error* err = loader.error();
///   fprintf(stderr, "[%s, line %lld, column %lld] %s\n",
///       err->filename(), err->line(), err->column(), err->message());
///   // Don't delete err, it's still owned by the loader.
/// }
/// ```
///
/// Implementation notes
/// --------------------
///
/// * The code is C++11.
///
/// * Loading is a three stage pipeline: the `Tokenizer` splits a buffer into
///   tokens, the `DirectiveParser` turns tokens into `Directive` records and
///   the `SceneBuilder` runs each directive against the graphics state.
///
/// * The first error stops the load. There is no partial scene and no
///   warnings.
///
/// * Entities refer to each other by index into the lists on `Scene`. An
///   index of `kInvalidIndex` means "none".
///
/// * Most material properties can be either a texture or a value. These
///   properties are represented as structs with type `ColorTex` or `FloatTex`.
///   In both structs, if the `texture` member is anything other than
///   `kInvalidIndex`, the texture should be used *instead* of the `value`.
///
/// * PLY files and image maps are not loaded, only their filenames are kept.

namespace pbrtscene {

  //
  // Constants
  //

  static constexpr uint32_t kInvalidIndex = 0xFFFFFFFFu;
  static constexpr uint32_t kDefaultMaxIncludeDepth = 5;


  //
  // Forward declarations
  //

  // Interfaces
  struct Accelerator;
  struct AreaLight;
  struct Camera;
  struct Film;
  struct Filter;
  struct Integrator;
  struct Light;
  struct Material;
  struct Medium;
  struct Sampler;
  struct Shape;
  struct Texture;

  // Instancing structs
  struct Object;
  struct Instance;

  struct Scene;
  class Error;


  //
  // Error codes
  //

  enum class ErrorCode : uint32_t {
    None,
    // Lexical
    InvalidToken,            //!< A token is empty, has an unbalanced quote or an embedded space.
    // Syntactic
    UnknownDirective,        //!< The leading token of a directive is not a known keyword.
    UnexpectedToken,         //!< A bracket or directive keyword where a value was expected.
    UnexpectedEOF,           //!< The input ended while a directive still needed tokens.
    InvalidString,           //!< A quoted string was expected.
    InvalidNumber,           //!< A token could not be parsed as a number.
    InvalidBool,             //!< A token could not be parsed as a bool.
    // Semantic
    DuplicateParam,          //!< Two params in one list share a name.
    InvalidParamType,        //!< Unknown type keyword in a param declaration.
    InvalidParamName,        //!< A param declaration has no name.
    UnknownCoordinateSystem, //!< Reference to a named coordinate system that was never defined.
    UnbalancedAttributes,    //!< Mismatched or unclosed Attribute/Transform/Object scopes.
    InvalidAttributeTarget,  //!< `Attribute` with a target other than shape, light, material, medium or texture.
    UnknownObject,           //!< `ObjectInstance` names an object that was never defined.
    NestedObject,            //!< Object definitions can't nest or contain instances.
    MissingWorldBegin,       //!< The input ended without a `WorldBegin`.
    MultipleWorldBegin,      //!< More than one `WorldBegin`.
    UnknownType,             //!< Unknown camera, shape, material, ... type name.
    MissingParam,            //!< A required parameter is missing.
    InvalidParamValue,       //!< A parameter value is not one of the allowed values.
    UnknownTexture,          //!< A texture param names a texture that was never defined.
    UnknownOption,           //!< `Option` with an unrecognised name.
    Unsupported,             //!< Directive or file type which this loader deliberately rejects.
    IncludeDepth,            //!< Includes nested deeper than the configured limit.
    // I/O
    IOError,                 //!< Failed to read the top-level file or an included file.
  };

  const char* error_code_name(ErrorCode code);


  //
  // Helper types
  //

  enum class ParamType : uint32_t {
    Bool,       //!< A boolean value.
    Int,        //!< 1 int: a single integer value.
    Float,      //!< 1 float: a single floating point value.
    Point2,     //!< 2 floats: a 2D point.
    Point3,     //!< 3 floats: a 3D point.
    Vector2,    //!< 2 floats: a 2D direction vector.
    Vector3,    //!< 3 floats: a 3D direction vector.
    Normal3,    //!< 3 floats: a 3D normal vector.
    Spectrum,   //!< 2n floats: n pairs of (wavelength, value) samples.
    RGB,        //!< 3 floats: an RGB color.
    Blackbody,  //!< 1 int: temperature in Kelvin.
    String,     //!< One or more strings.
    Texture,    //!< The name of a previously defined texture.
  };


  /// Which value container a param uses. This is determined by the param
  /// type alone.
  enum class ParamStorage : uint32_t {
    Floats,
    Ints,
    Strings,
    Bools,
  };


  enum class SpectrumType : uint32_t {
    RGB,
    Blackbody,
  };


  struct Spectrum {
    SpectrumType type;
    float rgb[3];    //!< Only valid if `type == SpectrumType::RGB`.
    int temperature; //!< In Kelvin. Only valid if `type == SpectrumType::Blackbody`.
  };

  inline Spectrum rgb_spectrum(float r, float g, float b)
  {
    Spectrum s = { SpectrumType::RGB, { r, g, b }, 0 };
    return s;
  }

  inline Spectrum blackbody_spectrum(int temperature)
  {
    Spectrum s = { SpectrumType::Blackbody, { 0.0f, 0.0f, 0.0f }, temperature };
    return s;
  }


  struct FloatTex {
    uint32_t texture;
    float value;
  };


  struct ColorTex {
    uint32_t texture;
    Spectrum value;
  };

  inline ColorTex color_tex(float r, float g, float b)
  {
    ColorTex c = { kInvalidIndex, rgb_spectrum(r, g, b) };
    return c;
  }


  struct Vec3 {
    float x, y, z;
  };


  /// A 4x4 row-major matrix, used with column vectors. All of the transform
  /// methods right-multiply: `m.translate(t)` sets `m = m * T`.
  struct Mat4 {
    float rows[4][4];

    void identity();                                  //!< Set this to the identity matrix.
    void translate(Vec3 v);                           //!< Multiply this matrix by a translation matrix
    void scale(Vec3 v);                               //!< Multiply this matrix by a scale matrix.
    void rotate(const float angleRadians, Vec3 axis); //!< Multiply this matrix by a rotation matrix.
    void lookAt(Vec3 pos, Vec3 target, Vec3 up);      //!< Multiply this matrix by a lookAt matrix.
    void concatTransform(const Mat4& m);              //!< Multiply this matrix by the given matrix.

    /// Set this to the matrix given by 16 values in column-major order, as
    /// they appear in `Transform` and `ConcatTransform` directives.
    void set_column_major(const float vals[16]);

    float det2x2(int r0, int r1, int c0, int c1) const;

    static Mat4 identity_matrix();
  };

  Mat4 inverse(const Mat4& m);


  //
  // Tokens
  //

  enum class TokenKind : uint32_t {
    OpenBracket,
    CloseBracket,
    String,   //!< Starts with a double quote.
    Bare,     //!< A keyword, number or bool.
    Comment,  //!< Starts with a '#'.
  };


  /// A view onto part of a text buffer. Tokens never own or copy their text,
  /// so they're only valid for as long as the buffer is.
  struct Token {
    const char* text = nullptr;
    size_t len       = 0;
    size_t offset    = 0; //!< Offset of the first char from the start of the buffer.

    Token() {}
    Token(const char* theText, size_t theLen, size_t theOffset = 0) :
      text(theText), len(theLen), offset(theOffset) {}
    explicit Token(const char* theText); // Whole of a nul-terminated string.

    TokenKind kind() const;

    bool is_valid() const;
    bool is_quoted() const;         //!< True if the first char is a double quote.
    bool is_open_bracket() const;
    bool is_close_bracket() const;
    bool is_comment() const;
    bool is_directive() const;      //!< True if this is a bare token naming a directive.
    bool equals(const char* str) const;

    std::string str() const;

    bool to_float(float* val) const;
    bool to_int(int* val) const;
    bool to_bool(bool* val) const;
    bool unquote(std::string* dest) const;
  };


  /// Splits a text buffer into tokens. The tokenizer never fails: malformed
  /// text still produces tokens, it's up to the caller to validate them.
  class Tokenizer {
  public:
    Tokenizer(const char* text, size_t len);

    void set_skip_comments(bool skip);

    bool next(Token* tok);  //!< Consume the next token. Returns false at the end of the buffer.
    bool peek(Token* tok);  //!< Get the next token without consuming it.

    size_t offset() const;  //!< Offset just past the last consumed token.
    const char* text() const;
    size_t length() const;

  private:
    bool scan(size_t pos, Token* tok, size_t* endPos) const;

  private:
    const char* m_text  = nullptr;
    size_t m_len        = 0;
    size_t m_pos        = 0;
    bool m_skipComments = false;
  };


  //
  // Parameters
  //

  bool param_type_from_name(const char* name, size_t len, ParamType* type);
  const char* param_type_name(ParamType type);
  ParamStorage param_storage(ParamType type);


  class Param {
  public:
    Param();
    Param(const std::string& theName, ParamType theType);

    const std::string& name() const;
    ParamType type() const;
    ParamStorage storage() const;
    uint32_t count() const;

    // Each of these returns false, without storing anything, if the value
    // doesn't match the storage for this param's type.
    bool add_float(float val);
    bool add_int(int val);
    bool add_string(const std::string& val);
    bool add_bool(bool val);

    // Return nullptr if the param uses a different storage.
    const std::vector<float>* floats() const;
    const std::vector<int>* ints() const;
    const std::vector<std::string>* strings() const;
    const std::vector<bool>* bools() const;

    /// An `rgb` param with exactly 3 values or a `blackbody` param with at
    /// least one value. Anything else returns false.
    bool spectrum(Spectrum* dest) const;

  private:
    std::string m_name;
    ParamType m_type       = ParamType::Float;
    ParamStorage m_storage = ParamStorage::Floats;

    std::vector<float> m_floats;
    std::vector<int> m_ints;
    std::vector<std::string> m_strings;
    std::vector<bool> m_bools;
  };


  class ParamList {
  public:
    bool add(const Param& param);          //!< Returns false if a param with the same name already exists.
    void merge(const ParamList& other);    //!< Copy every param from `other`, replacing any with the same name.
    void clear();

    size_t size() const;
    bool empty() const;

    const Param* find(const char* name) const;

    const std::vector<float>* floats(const char* name) const;
    const std::vector<int>* ints(const char* name) const;
    const std::vector<std::string>* strings(const char* name) const;
    const std::vector<bool>* bools(const char* name) const;

    float float_value(const char* name, float defaultVal) const;
    int int_value(const char* name, int defaultVal) const;
    bool bool_value(const char* name, bool defaultVal) const;
    const char* string_value(const char* name, const char* defaultVal = nullptr) const;

    bool spectrum(const char* name, Spectrum* dest) const;

  private:
    std::unordered_map<std::string, Param> m_params;
  };


  //
  // Directives
  //

  enum class DirectiveID : uint32_t {
    // Transforms
    Identity,
    Translate,
    Scale,
    Rotate,
    LookAt,
    Transform,
    ConcatTransform,
    CoordinateSystem,
    CoordSysTransform,
    TransformBegin,
    TransformEnd,
    TransformTimes,
    ActiveTransform,
    // Scopes
    AttributeBegin,
    AttributeEnd,
    Attribute,
    WorldBegin,
    ReverseOrientation,
    ObjectBegin,
    ObjectEnd,
    ObjectInstance,
    // Resources
    Option,
    ColorSpace,
    Camera,
    Film,
    Sampler,
    Integrator,
    Accelerator,
    PixelFilter,
    Shape,
    Material,
    MakeNamedMaterial,
    NamedMaterial,
    Texture,
    LightSource,
    AreaLightSource,
    MakeNamedMedium,
    MediumInterface,
    Include,
    Import,
  };

  const char* directive_name(DirectiveID id);
  bool find_directive(const char* keyword, size_t len, DirectiveID* id);


  /// One parsed directive. Which fields are filled in depends on `id`: the
  /// required float args go in `floats`, quoted string args go in `strings`
  /// in the order they appear, and the trailing param list goes in `params`.
  struct Directive {
    DirectiveID id       = DirectiveID::Identity;
    size_t offset        = 0;  //!< Offset of the keyword within its buffer.
    float floats[16];
    uint32_t numFloats   = 0;
    std::string strings[3];
    uint32_t numStrings  = 0;
    ParamList params;
    Param option;              //!< Only used by `Option`.

    void clear();
  };


  class DirectiveParser {
  public:
    DirectiveParser(const char* text, size_t len, const char* filename);
    ~DirectiveParser();

    /// Parse the next directive into `directive`. Returns false at the end of
    /// the input or if there was an error; use `has_error()` to tell them
    /// apart.
    bool next_directive(Directive* directive);

    const char* filename() const;
    const char* text() const;
    size_t length() const;

    void set_error(ErrorCode code, size_t offset, const char* fmt, ...);
    bool has_error() const;
    const Error* error() const;
    Error* take_error();

  private:
    bool read_token(Token* tok, const char* what);
    bool parse_floats(uint32_t n, Directive* directive);
    bool parse_string(Directive* directive);
    bool parse_keyword(Directive* directive);
    bool parse_params(ParamList* params);
    bool parse_param(Param* param);
    bool parse_value(const Token& tok, Param* param);

  private:
    Tokenizer m_tokenizer;
    std::string m_filename;
    Error* m_error = nullptr;
  };


  //
  // Accelerator types
  //

  enum class AcceleratorType {
    BVH,
    KdTree,
  };


  enum class BVHSplit {
    SAH,
    Middle,
    Equal,
    HLBVH,
  };


  struct Accelerator {
    virtual ~Accelerator() {}
    virtual AcceleratorType type() const = 0;
  };


  struct BVHAccelerator : public Accelerator {
    int maxnodeprims     = 4;
    BVHSplit splitmethod = BVHSplit::SAH;

    virtual ~BVHAccelerator() override {}
    virtual AcceleratorType type() const override { return AcceleratorType::BVH; }
  };


  struct KdTreeAccelerator : public Accelerator {
    int intersectcost = 5;
    int traversalcost = 1;
    float emptybonus  = 0.5f;
    int maxprims      = 1;
    int maxdepth      = -1;

    virtual ~KdTreeAccelerator() override {}
    virtual AcceleratorType type() const override { return AcceleratorType::KdTree; }
  };


  //
  // Area Light types
  //

  enum class AreaLightType {
    Diffuse,
  };


  struct AreaLight {
    float scale = 1.0f;
    float power = -1.0f; // Negative means unspecified.

    virtual ~AreaLight() {}
    virtual AreaLightType type() const = 0;
  };


  struct DiffuseAreaLight : public AreaLight {
    Spectrum L         = rgb_spectrum(1.0f, 1.0f, 1.0f);
    bool twosided      = false;
    std::string filename;

    virtual ~DiffuseAreaLight() override {}
    virtual AreaLightType type() const override { return AreaLightType::Diffuse; }
  };


  //
  // Camera types
  //

  enum class CameraType {
    Perspective,
    Orthographic,
    Spherical,
    Realistic,
  };


  enum class SphericalMapping {
    EqualArea,
    Equirectangular,
  };


  struct Camera {
    Mat4 cameraToWorld;
    float shutteropen  = 0.0f;
    float shutterclose = 1.0f;
    uint32_t medium    = kInvalidIndex;

    Camera() { cameraToWorld.identity(); }
    virtual ~Camera() {}
    virtual CameraType type() const = 0;
  };


  struct ProjectiveCamera : public Camera {
    float frameaspectratio  = 0.0f; // 0 or less means "compute this from the film resolution"
    float screenwindow[4]   = { 0.0f, 0.0f, 0.0f, 0.0f }; // endx <= startx or endy <= starty means "compute this from the film resolution"
    float lensradius        = 0.0f;
    float focaldistance     = 1e6f;

    virtual ~ProjectiveCamera() override {}
  };


  struct PerspectiveCamera : public ProjectiveCamera {
    float fov = 90.0f;

    virtual ~PerspectiveCamera() override {}
    virtual CameraType type() const override { return CameraType::Perspective; }
  };


  struct OrthographicCamera : public ProjectiveCamera {
    virtual ~OrthographicCamera() override {}
    virtual CameraType type() const override { return CameraType::Orthographic; }
  };


  struct SphericalCamera : public Camera {
    SphericalMapping mapping = SphericalMapping::EqualArea;

    virtual ~SphericalCamera() override {}
    virtual CameraType type() const override { return CameraType::Spherical; }
  };


  struct RealisticCamera : public Camera {
    std::string lensfile;
    float aperturediameter = 1.0f;
    float focusdistance    = 10.0f;
    std::string aperture;

    virtual ~RealisticCamera() override {}
    virtual CameraType type() const override { return CameraType::Realistic; }
  };


  //
  // Film types
  //

  enum class FilmType {
    RGB,
    GBuffer,
    Spectral,
  };


  struct Film {
    int xresolution         = 1280;
    int yresolution         = 720;
    float cropwindow[4]     = { 0.0f, 1.0f, 0.0f, 1.0f };
    float diagonal          = 35.0f; // in millimetres
    std::string filename    = "pbrt.exr";
    bool savefp16           = true;
    float iso               = 100.0f;
    float whitebalance      = 0.0f;
    std::string sensor      = "cie1931";
    float maxcomponentvalue = std::numeric_limits<float>::infinity();

    virtual ~Film() {}
    virtual FilmType type() const = 0;
  };


  struct RGBFilm : public Film {
    virtual ~RGBFilm() override {}
    virtual FilmType type() const override { return FilmType::RGB; }
  };


  struct GBufferFilm : public Film {
    std::string coordinatesystem = "camera";

    virtual ~GBufferFilm() override {}
    virtual FilmType type() const override { return FilmType::GBuffer; }
  };


  struct SpectralFilm : public Film {
    int nbuckets    = 16;
    float lambdamin = 360.0f;
    float lambdamax = 830.0f;

    virtual ~SpectralFilm() override {}
    virtual FilmType type() const override { return FilmType::Spectral; }
  };


  //
  // Filter types
  //

  enum class FilterType {
    Box,
    Gaussian,
    Mitchell,
    Sinc,
    Triangle,
  };


  struct Filter {
    float xradius;
    float yradius;

    virtual ~Filter() {}
    virtual FilterType type() const = 0;
  };


  struct BoxFilter : public Filter {
    BoxFilter() { xradius = yradius = 0.5f; }
    virtual ~BoxFilter() override {}
    virtual FilterType type() const override { return FilterType::Box; }
  };


  struct GaussianFilter : public Filter {
    float sigma = 0.5f;

    GaussianFilter() { xradius = yradius = 1.5f; }
    virtual ~GaussianFilter() override {}
    virtual FilterType type() const override { return FilterType::Gaussian; }
  };


  struct MitchellFilter : public Filter {
    float B = 1.0f / 3.0f;
    float C = 1.0f / 3.0f;

    MitchellFilter() { xradius = yradius = 2.0f; }
    virtual ~MitchellFilter() override {}
    virtual FilterType type() const override { return FilterType::Mitchell; }
  };


  struct SincFilter : public Filter {
    float tau = 3.0f;

    SincFilter() { xradius = yradius = 4.0f; }
    virtual ~SincFilter() override {}
    virtual FilterType type() const override { return FilterType::Sinc; }
  };


  struct TriangleFilter : public Filter {
    TriangleFilter() { xradius = yradius = 2.0f; }
    virtual ~TriangleFilter() override {}
    virtual FilterType type() const override { return FilterType::Triangle; }
  };


  //
  // Integrator types
  //

  enum class IntegratorType {
    AmbientOcclusion,
    BDPT,
    LightPath,
    MLT,
    Path,
    RandomWalk,
    SimplePath,
    SimpleVolPath,
    SPPM,
    VolPath,
  };


  struct Integrator {
    int maxdepth             = 5;
    bool regularize          = false;
    std::string lightsampler = "bvh";

    virtual ~Integrator() {}
    virtual IntegratorType type() const = 0;
  };


  struct AOIntegrator : public Integrator {
    bool cossample    = true;
    float maxdistance = std::numeric_limits<float>::infinity();

    virtual ~AOIntegrator() override {}
    virtual IntegratorType type() const override { return IntegratorType::AmbientOcclusion; }
  };


  struct BDPTIntegrator : public Integrator {
    bool visualizestrategies = false;
    bool visualizeweights    = false;

    virtual ~BDPTIntegrator() override {}
    virtual IntegratorType type() const override { return IntegratorType::BDPT; }
  };


  struct LightPathIntegrator : public Integrator {
    virtual ~LightPathIntegrator() override {}
    virtual IntegratorType type() const override { return IntegratorType::LightPath; }
  };


  struct MLTIntegrator : public Integrator {
    int bootstrapsamples        = 100000;
    int chains                  = 1000;
    int mutationsperpixel       = 100;
    float largestepprobability  = 0.3f;
    float sigma                 = 0.01f;

    virtual ~MLTIntegrator() override {}
    virtual IntegratorType type() const override { return IntegratorType::MLT; }
  };


  struct PathIntegrator : public Integrator {
    virtual ~PathIntegrator() override {}
    virtual IntegratorType type() const override { return IntegratorType::Path; }
  };


  struct RandomWalkIntegrator : public Integrator {
    virtual ~RandomWalkIntegrator() override {}
    virtual IntegratorType type() const override { return IntegratorType::RandomWalk; }
  };


  struct SimplePathIntegrator : public Integrator {
    bool samplelights = true;
    bool samplebsdf   = true;

    virtual ~SimplePathIntegrator() override {}
    virtual IntegratorType type() const override { return IntegratorType::SimplePath; }
  };


  struct SimpleVolPathIntegrator : public Integrator {
    virtual ~SimpleVolPathIntegrator() override {}
    virtual IntegratorType type() const override { return IntegratorType::SimpleVolPath; }
  };


  struct SPPMIntegrator : public Integrator {
    int iterations           = 64;
    int photonsperiteration  = -1; // -1 means "use the number of pixels"
    float radius             = 1.0f;
    int seed                 = 0;

    virtual ~SPPMIntegrator() override {}
    virtual IntegratorType type() const override { return IntegratorType::SPPM; }
  };


  struct VolPathIntegrator : public Integrator {
    virtual ~VolPathIntegrator() override {}
    virtual IntegratorType type() const override { return IntegratorType::VolPath; }
  };


  //
  // Light types
  //

  enum class LightType {
    Distant,
    Goniometric,
    Infinite,
    Point,
    Projection,
    Spot,
  };


  struct Light {
    Mat4 lightToWorld;
    uint32_t medium = kInvalidIndex;
    float scale     = 1.0f;
    float power     = -1.0f; // Negative means unspecified.

    Light() { lightToWorld.identity(); }
    virtual ~Light() {}
    virtual LightType type() const = 0;
  };


  struct DistantLight : public Light {
    Spectrum L      = rgb_spectrum(1.0f, 1.0f, 1.0f);
    float from[3]   = { 0.0f, 0.0f, 0.0f };
    float to[3]     = { 0.0f, 0.0f, 1.0f };

    virtual ~DistantLight() override {}
    virtual LightType type() const override { return LightType::Distant; }
  };


  struct GoniometricLight : public Light {
    Spectrum I = rgb_spectrum(1.0f, 1.0f, 1.0f);
    std::string filename;

    virtual ~GoniometricLight() override {}
    virtual LightType type() const override { return LightType::Goniometric; }
  };


  struct InfiniteLight : public Light {
    Spectrum L         = rgb_spectrum(1.0f, 1.0f, 1.0f);
    bool hasL          = false; // False if the light uses an environment map or the default illuminant.
    std::string filename;
    std::vector<float> portal; // 4 points, 12 floats, if present.
    float illuminance  = -1.0f;

    virtual ~InfiniteLight() override {}
    virtual LightType type() const override { return LightType::Infinite; }
  };


  struct PointLight : public Light {
    Spectrum I    = rgb_spectrum(1.0f, 1.0f, 1.0f);
    float from[3] = { 0.0f, 0.0f, 0.0f };

    virtual ~PointLight() override {}
    virtual LightType type() const override { return LightType::Point; }
  };


  struct ProjectionLight : public Light {
    float fov = 90.0f;
    std::string filename;

    virtual ~ProjectionLight() override {}
    virtual LightType type() const override { return LightType::Projection; }
  };


  struct SpotLight : public Light {
    Spectrum I       = rgb_spectrum(1.0f, 1.0f, 1.0f);
    float from[3]    = { 0.0f, 0.0f, 0.0f };
    float to[3]      = { 0.0f, 0.0f, 1.0f };
    float coneangle  = 30.0f;
    float conedelta  = 5.0f;

    virtual ~SpotLight() override {}
    virtual LightType type() const override { return LightType::Spot; }
  };


  //
  // Material types
  //

  enum class MaterialType {
    CoatedConductor,
    CoatedDiffuse,
    Conductor,
    Dielectric,
    Diffuse,
    DiffuseTransmission,
    Hair,
    Interface,
    Measured,
    Mix,
    Subsurface,
    ThinDielectric,
  };


  struct Material {
    std::string name;
    FloatTex displacement = { kInvalidIndex, 0.0f };
    std::string normalmap;

    virtual ~Material() {}
    virtual MaterialType type() const = 0;
  };


  struct CoatedConductorMaterial : public Material {
    FloatTex interface_uroughness  = { kInvalidIndex, 0.0f };
    FloatTex interface_vroughness  = { kInvalidIndex, 0.0f };
    FloatTex thickness             = { kInvalidIndex, 0.01f };
    FloatTex interface_eta         = { kInvalidIndex, 1.5f };
    FloatTex conductor_uroughness  = { kInvalidIndex, 0.0f };
    FloatTex conductor_vroughness  = { kInvalidIndex, 0.0f };
    ColorTex conductor_eta         = color_tex(0.2004f, 0.9240f, 1.1022f); // copper
    ColorTex conductor_k           = color_tex(3.9129f, 2.4528f, 2.1421f); // copper
    ColorTex reflectance           = color_tex(0.0f, 0.0f, 0.0f);
    bool hasReflectance            = false; // If true, use `reflectance` instead of eta & k.
    FloatTex g                     = { kInvalidIndex, 0.0f };
    ColorTex albedo                = color_tex(0.0f, 0.0f, 0.0f);
    int maxdepth                   = 10;
    int nsamples                   = 1;
    bool remaproughness            = true;

    virtual ~CoatedConductorMaterial() override {}
    virtual MaterialType type() const override { return MaterialType::CoatedConductor; }
  };


  struct CoatedDiffuseMaterial : public Material {
    ColorTex reflectance = color_tex(0.5f, 0.5f, 0.5f);
    FloatTex uroughness  = { kInvalidIndex, 0.0f };
    FloatTex vroughness  = { kInvalidIndex, 0.0f };
    FloatTex thickness   = { kInvalidIndex, 0.01f };
    FloatTex eta         = { kInvalidIndex, 1.5f };
    FloatTex g           = { kInvalidIndex, 0.0f };
    ColorTex albedo      = color_tex(0.0f, 0.0f, 0.0f);
    int maxdepth         = 10;
    int nsamples         = 1;
    bool remaproughness  = true;

    virtual ~CoatedDiffuseMaterial() override {}
    virtual MaterialType type() const override { return MaterialType::CoatedDiffuse; }
  };


  struct ConductorMaterial : public Material {
    ColorTex eta         = color_tex(0.2004f, 0.9240f, 1.1022f); // copper
    ColorTex k           = color_tex(3.9129f, 2.4528f, 2.1421f); // copper
    ColorTex reflectance = color_tex(0.0f, 0.0f, 0.0f);
    bool hasReflectance  = false; // If true, use `reflectance` instead of eta & k.
    FloatTex uroughness  = { kInvalidIndex, 0.0f };
    FloatTex vroughness  = { kInvalidIndex, 0.0f };
    bool remaproughness  = true;

    virtual ~ConductorMaterial() override {}
    virtual MaterialType type() const override { return MaterialType::Conductor; }
  };


  struct DielectricMaterial : public Material {
    FloatTex eta        = { kInvalidIndex, 1.5f };
    FloatTex uroughness = { kInvalidIndex, 0.0f };
    FloatTex vroughness = { kInvalidIndex, 0.0f };
    bool remaproughness = true;

    virtual ~DielectricMaterial() override {}
    virtual MaterialType type() const override { return MaterialType::Dielectric; }
  };


  struct DiffuseMaterial : public Material {
    ColorTex reflectance = color_tex(0.5f, 0.5f, 0.5f);

    virtual ~DiffuseMaterial() override {}
    virtual MaterialType type() const override { return MaterialType::Diffuse; }
  };


  struct DiffuseTransmissionMaterial : public Material {
    ColorTex reflectance   = color_tex(0.25f, 0.25f, 0.25f);
    ColorTex transmittance = color_tex(0.25f, 0.25f, 0.25f);
    float scale            = 1.0f;

    virtual ~DiffuseTransmissionMaterial() override {}
    virtual MaterialType type() const override { return MaterialType::DiffuseTransmission; }
  };


  struct HairMaterial : public Material {
    ColorTex sigma_a     = color_tex(0.0f, 0.0f, 0.0f);
    ColorTex color       = color_tex(0.0f, 0.0f, 0.0f);
    FloatTex eumelanin   = { kInvalidIndex, 1.3f  };
    FloatTex pheomelanin = { kInvalidIndex, 0.0f  };
    FloatTex eta         = { kInvalidIndex, 1.55f };
    FloatTex beta_m      = { kInvalidIndex, 0.3f  };
    FloatTex beta_n      = { kInvalidIndex, 0.3f  };
    FloatTex alpha       = { kInvalidIndex, 2.0f  };
    bool has_sigma_a     = false;
    bool has_color       = false;

    virtual ~HairMaterial() override {}
    virtual MaterialType type() const override { return MaterialType::Hair; }
  };


  struct InterfaceMaterial : public Material {
    virtual ~InterfaceMaterial() override {}
    virtual MaterialType type() const override { return MaterialType::Interface; }
  };


  struct MeasuredMaterial : public Material {
    std::string filename;

    virtual ~MeasuredMaterial() override {}
    virtual MaterialType type() const override { return MaterialType::Measured; }
  };


  struct MixMaterial : public Material {
    FloatTex amount         = { kInvalidIndex, 0.5f };
    uint32_t namedmaterial1 = kInvalidIndex;
    uint32_t namedmaterial2 = kInvalidIndex;

    virtual ~MixMaterial() override {}
    virtual MaterialType type() const override { return MaterialType::Mix; }
  };


  struct SubsurfaceMaterial : public Material {
    std::string coefficients; // name of the measured subsurface scattering coefficients
    FloatTex eta            = { kInvalidIndex, 1.33f };
    float g                 = 0.0f;
    ColorTex mfp            = color_tex(1.0f, 1.0f, 1.0f);
    bool hasMfp             = false;
    ColorTex reflectance    = color_tex(1.0f, 1.0f, 1.0f);
    bool hasReflectance     = false;
    ColorTex sigma_a        = color_tex(0.0011f, 0.0024f, 0.014f);
    ColorTex sigma_s        = color_tex(2.55f, 3.21f, 3.77f);
    float scale             = 1.0f;
    FloatTex uroughness     = { kInvalidIndex, 0.0f };
    FloatTex vroughness     = { kInvalidIndex, 0.0f };
    bool remaproughness     = true;

    virtual ~SubsurfaceMaterial() override {}
    virtual MaterialType type() const override { return MaterialType::Subsurface; }
  };


  struct ThinDielectricMaterial : public Material {
    FloatTex eta = { kInvalidIndex, 1.5f };

    virtual ~ThinDielectricMaterial() override {}
    virtual MaterialType type() const override { return MaterialType::ThinDielectric; }
  };


  //
  // Medium types
  //

  enum class MediumType {
    Homogeneous,
    UniformGrid,
    Cloud,
    NanoVDB,
  };


  struct Medium {
    std::string mediumName;
    Mat4 mediumToWorld;
    Spectrum sigma_a = rgb_spectrum(1.0f, 1.0f, 1.0f);
    Spectrum sigma_s = rgb_spectrum(1.0f, 1.0f, 1.0f);
    float scale      = 1.0f;
    float g          = 0.0f;
    std::string preset;

    Medium() { mediumToWorld.identity(); }
    virtual ~Medium() {}
    virtual MediumType type() const = 0;
  };


  struct HomogeneousMedium : public Medium {
    Spectrum Le   = rgb_spectrum(0.0f, 0.0f, 0.0f);
    float Lescale = 1.0f;

    virtual ~HomogeneousMedium() override {}
    virtual MediumType type() const override { return MediumType::Homogeneous; }
  };


  struct UniformGridMedium : public Medium {
    int nx = 1;
    int ny = 1;
    int nz = 1;
    std::vector<float> density; // nx * ny * nz values, x varies fastest.
    float p0[3]   = { 0.0f, 0.0f, 0.0f };
    float p1[3]   = { 1.0f, 1.0f, 1.0f };
    Spectrum Le   = rgb_spectrum(0.0f, 0.0f, 0.0f);
    float Lescale = 1.0f;

    virtual ~UniformGridMedium() override {}
    virtual MediumType type() const override { return MediumType::UniformGrid; }
  };


  struct CloudMedium : public Medium {
    float density   = 1.0f;
    float wispiness = 1.0f;
    float frequency = 5.0f;
    float p0[3]     = { 0.0f, 0.0f, 0.0f };
    float p1[3]     = { 1.0f, 1.0f, 1.0f };

    virtual ~CloudMedium() override {}
    virtual MediumType type() const override { return MediumType::Cloud; }
  };


  struct NanoVDBMedium : public Medium {
    std::string filename;
    float Lescale           = 1.0f;
    float temperaturecutoff = 0.0f;
    float temperaturescale  = 1.0f;

    virtual ~NanoVDBMedium() override {}
    virtual MediumType type() const override { return MediumType::NanoVDB; }
  };


  //
  // Sampler types
  //

  enum class SamplerType {
    Halton,
    Independent,
    PaddedSobol,
    PMJ02BN,
    Sobol,
    Stratified,
    ZSobol,
  };


  struct Sampler {
    int pixelsamples = 16;
    int seed         = 0;

    virtual ~Sampler() {}
    virtual SamplerType type() const = 0;
  };


  struct HaltonSampler : public Sampler {
    std::string randomization = "permutedigits";

    virtual ~HaltonSampler() override {}
    virtual SamplerType type() const override { return SamplerType::Halton; }
  };


  struct IndependentSampler : public Sampler {
    virtual ~IndependentSampler() override {}
    virtual SamplerType type() const override { return SamplerType::Independent; }
  };


  struct PaddedSobolSampler : public Sampler {
    std::string randomization = "fastowen";

    virtual ~PaddedSobolSampler() override {}
    virtual SamplerType type() const override { return SamplerType::PaddedSobol; }
  };


  struct PMJ02BNSampler : public Sampler {
    virtual ~PMJ02BNSampler() override {}
    virtual SamplerType type() const override { return SamplerType::PMJ02BN; }
  };


  struct SobolSampler : public Sampler {
    std::string randomization = "fastowen";

    virtual ~SobolSampler() override {}
    virtual SamplerType type() const override { return SamplerType::Sobol; }
  };


  struct StratifiedSampler : public Sampler {
    bool jitter  = true;
    int xsamples = 4;
    int ysamples = 4;

    virtual ~StratifiedSampler() override {}
    virtual SamplerType type() const override { return SamplerType::Stratified; }
  };


  struct ZSobolSampler : public Sampler {
    std::string randomization = "fastowen";

    virtual ~ZSobolSampler() override {}
    virtual SamplerType type() const override { return SamplerType::ZSobol; }
  };


  //
  // Shape types
  //

  enum class ShapeType {
    BilinearMesh,
    Curve,
    Cylinder,
    Disk,
    LoopSubdiv,
    PLYMesh,
    Sphere,
    TriangleMesh,
  };


  enum class CurveBasis {
    Bezier,
    BSpline,
  };


  enum class CurveType {
    Flat,
    Ribbon,
    Cylinder,
  };


  struct Shape {
    Mat4 shapeToWorld; // If shape is part of an object, this is the shapeToObject transform.
    uint32_t material       = kInvalidIndex;
    uint32_t areaLight      = kInvalidIndex;
    uint32_t insideMedium   = kInvalidIndex;
    uint32_t outsideMedium  = kInvalidIndex;
    uint32_t object         = kInvalidIndex; // The object that this shape is part of, or kInvalidIndex if it's not part of one.
    bool reverseOrientation = false;
    FloatTex alpha          = { kInvalidIndex, 1.0f };
    std::string emissionfilename;

    Shape() { shapeToWorld.identity(); }
    virtual ~Shape() {}
    virtual ShapeType type() const = 0;
  };


  struct BilinearMesh : public Shape {
    std::vector<int> indices;   // 4 per patch.
    std::vector<float> P;       // Elements 3i, 3i+1 and 3i+2 are the xyz position components for vertex i.
    std::vector<float> N;
    std::vector<float> uv;

    virtual ~BilinearMesh() override {}
    virtual ShapeType type() const override { return ShapeType::BilinearMesh; }
  };


  struct Curve : public Shape {
    std::vector<float> P;
    CurveBasis basis = CurveBasis::Bezier;
    int degree       = 3;
    CurveType curvetype = CurveType::Flat;
    std::vector<float> N;
    float width0     = 1.0f;
    float width1     = 1.0f;
    int splitdepth   = 3;

    virtual ~Curve() override {}
    virtual ShapeType type() const override { return ShapeType::Curve; }
  };


  struct Cylinder : public Shape {
    float radius = 1.0f;
    float zmin   = -1.0f;
    float zmax   = 1.0f;
    float phimax = 360.0f;

    virtual ~Cylinder() override {}
    virtual ShapeType type() const override { return ShapeType::Cylinder; }
  };


  struct Disk : public Shape {
    float height      = 0.0f;
    float radius      = 1.0f;
    float innerradius = 0.0f;
    float phimax      = 360.0f;

    virtual ~Disk() override {}
    virtual ShapeType type() const override { return ShapeType::Disk; }
  };


  struct LoopSubdiv : public Shape {
    int levels = 3;
    std::vector<int> indices;
    std::vector<float> P;

    virtual ~LoopSubdiv() override {}
    virtual ShapeType type() const override { return ShapeType::LoopSubdiv; }
  };


  struct PLYMesh : public Shape {
    std::string filename;
    FloatTex displacement  = { kInvalidIndex, 0.0f };
    bool hasDisplacement   = false;
    float edgelength       = 1.0f;

    virtual ~PLYMesh() override {}
    virtual ShapeType type() const override { return ShapeType::PLYMesh; }
  };


  struct Sphere : public Shape {
    float radius  = 1.0f;
    float zmin    = -1.0f; // Will be set to -radius
    float zmax    = 1.0f;  // Will be set to +radius
    float phimax  = 360.0f;

    virtual ~Sphere() override {}
    virtual ShapeType type() const override { return ShapeType::Sphere; }
  };


  struct TriangleMesh : public Shape {
    std::vector<int> indices;
    std::vector<float> P;  // Elements 3i, 3i+1 and 3i+2 are the xyz position components for vertex i.
    std::vector<float> N;  // Elements 3i, 3i+1 and 3i+2 are the xyz normal components for vertex i.
    std::vector<float> S;  // Elements 3i, 3i+1 and 3i+2 are the xyz tangent components for vertex i.
    std::vector<float> uv; // Elements 2i and 2i+1 are the uv coords for vertex i.
    std::vector<int> faceIndices;

    virtual ~TriangleMesh() override {}
    virtual ShapeType type() const override { return ShapeType::TriangleMesh; }
  };


  //
  // Texture types
  //

  enum class TextureType {
    Bilerp,
    Checkerboard,
    Constant,
    DirectionMix,
    Dots,
    FBM,
    ImageMap,
    Marble,
    Mix,
    PTex,
    Scale,
    Windy,
    Wrinkled,
  };


  enum class TextureData {
    Float,
    Spectrum,
  };


  enum class TexCoordMapping {
    UV,
    Spherical,
    Cylindrical,
    Planar,
  };


  enum class WrapMode {
    Repeat,
    Black,
    Clamp,
    OctahedralSphere,
  };


  /// Texture values use `ColorTex` for both data types. For float textures
  /// every channel of an RGB value holds the same number.
  struct Texture {
    std::string name;
    TextureData dataType = TextureData::Spectrum;
    Mat4 textureToWorld;

    Texture() { textureToWorld.identity(); }
    virtual ~Texture() {}
    virtual TextureType type() const = 0;
  };


  struct Texture2D : public Texture {
    TexCoordMapping mapping = TexCoordMapping::UV;
    float uscale            = 1.0f;
    float vscale            = 1.0f;
    float udelta            = 0.0f;
    float vdelta            = 0.0f;
    float v1[3]             = { 1.0f, 0.0f, 0.0f };
    float v2[3]             = { 0.0f, 1.0f, 0.0f };

    virtual ~Texture2D() override {}
  };


  struct BilerpTexture : public Texture2D {
    ColorTex v00 = color_tex(0.0f, 0.0f, 0.0f);
    ColorTex v01 = color_tex(1.0f, 1.0f, 1.0f);
    ColorTex v10 = color_tex(0.0f, 0.0f, 0.0f);
    ColorTex v11 = color_tex(1.0f, 1.0f, 1.0f);

    virtual ~BilerpTexture() override {}
    virtual TextureType type() const override { return TextureType::Bilerp; }
  };


  struct CheckerboardTexture : public Texture2D {
    int dimension = 2;
    ColorTex tex1 = color_tex(1.0f, 1.0f, 1.0f);
    ColorTex tex2 = color_tex(0.0f, 0.0f, 0.0f);

    virtual ~CheckerboardTexture() override {}
    virtual TextureType type() const override { return TextureType::Checkerboard; }
  };


  struct ConstantTexture : public Texture {
    ColorTex value = color_tex(1.0f, 1.0f, 1.0f);

    virtual ~ConstantTexture() override {}
    virtual TextureType type() const override { return TextureType::Constant; }
  };


  struct DirectionMixTexture : public Texture {
    ColorTex tex1 = color_tex(0.0f, 0.0f, 0.0f);
    ColorTex tex2 = color_tex(1.0f, 1.0f, 1.0f);
    float dir[3]  = { 0.0f, 1.0f, 0.0f };

    virtual ~DirectionMixTexture() override {}
    virtual TextureType type() const override { return TextureType::DirectionMix; }
  };


  struct DotsTexture : public Texture2D {
    ColorTex inside  = color_tex(1.0f, 1.0f, 1.0f);
    ColorTex outside = color_tex(0.0f, 0.0f, 0.0f);

    virtual ~DotsTexture() override {}
    virtual TextureType type() const override { return TextureType::Dots; }
  };


  struct FBMTexture : public Texture {
    int octaves     = 8;
    float roughness = 0.5f;

    virtual ~FBMTexture() override {}
    virtual TextureType type() const override { return TextureType::FBM; }
  };


  struct ImageMapTexture : public Texture2D {
    std::string filename;
    WrapMode wrap       = WrapMode::Repeat;
    float maxanisotropy = 8.0f;
    std::string filter  = "bilinear";
    std::string encoding;
    float scale         = 1.0f;
    bool invert         = false;

    virtual ~ImageMapTexture() override {}
    virtual TextureType type() const override { return TextureType::ImageMap; }
  };


  struct MarbleTexture : public Texture {
    int octaves     = 8;
    float roughness = 0.5f;
    float scale     = 1.0f;
    float variation = 0.2f;

    virtual ~MarbleTexture() override {}
    virtual TextureType type() const override { return TextureType::Marble; }
  };


  struct MixTexture : public Texture {
    ColorTex tex1   = color_tex(0.0f, 0.0f, 0.0f);
    ColorTex tex2   = color_tex(1.0f, 1.0f, 1.0f);
    FloatTex amount = { kInvalidIndex, 0.5f };

    virtual ~MixTexture() override {}
    virtual TextureType type() const override { return TextureType::Mix; }
  };


  struct PTexTexture : public Texture {
    std::string filename;
    std::string encoding = "gamma 2.2";
    float scale          = 1.0f;

    virtual ~PTexTexture() override {}
    virtual TextureType type() const override { return TextureType::PTex; }
  };


  struct ScaleTexture : public Texture {
    ColorTex tex    = color_tex(1.0f, 1.0f, 1.0f);
    FloatTex scale  = { kInvalidIndex, 1.0f };

    virtual ~ScaleTexture() override {}
    virtual TextureType type() const override { return TextureType::Scale; }
  };


  struct WindyTexture : public Texture {
    virtual ~WindyTexture() override {}
    virtual TextureType type() const override { return TextureType::Windy; }
  };


  struct WrinkledTexture : public Texture {
    int octaves     = 8;
    float roughness = 0.5f;

    virtual ~WrinkledTexture() override {}
    virtual TextureType type() const override { return TextureType::Wrinkled; }
  };


  //
  // Object instancing types
  //

  struct Object {
    std::string name;
    Mat4 objectToInstance;
    uint32_t firstShape    = kInvalidIndex;
    unsigned int numShapes = 0;
  };


  struct Instance {
    Mat4 instanceToWorld;
    uint32_t object          = kInvalidIndex; //!< The object that this is an instance of.
    uint32_t areaLight       = kInvalidIndex; //!< If valid, the instance emits light as described by this area light.
    uint32_t insideMedium    = kInvalidIndex;
    uint32_t outsideMedium   = kInvalidIndex;
    bool reverseOrientation  = false;
  };


  //
  // Scene types
  //

  enum class RenderCoordSys {
    CameraWorld,
    Camera,
    World,
  };


  enum class ColorSpace {
    SRGB,
    ACES2065_1,
    Rec2020,
    DCI_P3,
  };


  /// Scene-wide settings from `Option` directives.
  struct Options {
    bool disablepixeljitter       = false;
    bool disabletexturefiltering  = false;
    bool disablewavelengthjitter  = false;
    float displacementedgescale   = 1.0f;
    std::string msereferenceimage;
    std::string msereferenceout;
    RenderCoordSys rendercoordsys = RenderCoordSys::CameraWorld;
    int seed                      = 0;
    bool forcediffuse             = false;
    bool pixelstats               = false;
    bool wavefront                = false;
  };


  struct Scene {
    Options options;
    ColorSpace colorSpace    = ColorSpace::SRGB;

    Accelerator* accelerator = nullptr;
    Camera* camera           = nullptr;
    Film* film               = nullptr;
    Filter* filter           = nullptr;
    Integrator* integrator   = nullptr;
    Sampler* sampler         = nullptr;

    std::vector<Shape*>     shapes;
    std::vector<Object*>    objects;
    std::vector<Instance*>  instances;
    std::vector<Light*>     lights;
    std::vector<AreaLight*> areaLights;
    std::vector<Material*>  materials;
    std::vector<Texture*>   textures;
    std::vector<Medium*>    mediums;

    Scene();
    ~Scene();

    Scene(const Scene&) = delete;
    Scene& operator = (const Scene&) = delete;
  };


  //
  // Type names
  //

  // The name used for each enum value in scene files, e.g. "sphere" for
  // `ShapeType::Sphere`. Out of range values give an empty string.
  const char* type_name(AcceleratorType type);
  const char* type_name(AreaLightType type);
  const char* type_name(CameraType type);
  const char* type_name(FilmType type);
  const char* type_name(FilterType type);
  const char* type_name(IntegratorType type);
  const char* type_name(LightType type);
  const char* type_name(MaterialType type);
  const char* type_name(MediumType type);
  const char* type_name(SamplerType type);
  const char* type_name(ShapeType type);
  const char* type_name(TextureType type);
  const char* type_name(BVHSplit split);
  const char* type_name(SphericalMapping mapping);
  const char* type_name(ColorSpace colorSpace);
  const char* type_name(RenderCoordSys coordSys);


  //
  // Entity creation
  //

  typedef std::unordered_map<std::string, uint32_t> NameToIndex;

  /// Name to index maps for everything a material or texture can refer to.
  struct TextureLookup {
    const NameToIndex* floatTextures    = nullptr;
    const NameToIndex* spectrumTextures = nullptr;
    const NameToIndex* namedMaterials   = nullptr;
  };


  /// Why an entity couldn't be created.
  struct CreateError {
    ErrorCode code = ErrorCode::None;
    std::string message;
  };


  // Each of these builds a new entity from a type name and a fully merged
  // param list, copying out every value it keeps. They return nullptr and
  // fill in `err` if the type is unknown or a param is missing or invalid.
  Accelerator* create_accelerator(const std::string& typeName, const ParamList& params, CreateError* err);
  Camera* create_camera(const std::string& typeName, const ParamList& params, CreateError* err);
  Film* create_film(const std::string& typeName, const ParamList& params, CreateError* err);
  Filter* create_filter(const std::string& typeName, const ParamList& params, CreateError* err);
  Integrator* create_integrator(const std::string& typeName, const ParamList& params, CreateError* err);
  Sampler* create_sampler(const std::string& typeName, const ParamList& params, CreateError* err);
  Shape* create_shape(const std::string& typeName, const ParamList& params, const TextureLookup& textures, CreateError* err);
  Light* create_light(const std::string& typeName, const ParamList& params, CreateError* err);
  AreaLight* create_area_light(const std::string& typeName, const ParamList& params, CreateError* err);
  Material* create_material(const std::string& typeName, const ParamList& params, const TextureLookup& textures, CreateError* err);
  Texture* create_texture(const std::string& typeName, TextureData dataType, const ParamList& params, const TextureLookup& textures, CreateError* err);
  Medium* create_medium(const std::string& typeName, const ParamList& params, CreateError* err);


  //
  // Error struct declaration
  //

  /// The class used to represent an error during parsing. It records where in
  /// the input file(s) the error occurred.
  class Error {
  public:
    // Error takes a copy of both `theFilename` and `theMessage`.
    Error(ErrorCode theCode, const char* theFilename, int64_t theOffset, const char* theMessage);
    ~Error();

    Error(const Error&) = delete;
    Error& operator = (const Error&) = delete;

    ErrorCode code() const;
    const char* filename() const;
    const char* message() const;
    int64_t offset() const;
    int64_t line() const;
    int64_t column() const;

    bool has_line_and_column() const;
    void set_line_and_column(int64_t theLine, int64_t theColumn);

    int compare(const Error& rhs) const;

  private:
    ErrorCode m_code       = ErrorCode::None;
    const char* m_filename = nullptr; //!< Name of the file the error occurred in.
    const char* m_message  = nullptr; //!< The error message.
    int64_t m_offset       = 0;       //!< Char offset within the file at which the error occurred.
    int64_t m_line         = 0;       //!< Line number the error occurred on. The first line in a file is 1, 0 indicates the line number hasn't been calculated yet.
    int64_t m_column       = 0;       //!< Column number the error occurred on. The first column is 1, 0 indicates the column number hasn't been calculated yet.
  };


  /// Line and column (both starting at 1) of a byte offset within `text`.
  void find_line_and_column(const char* text, size_t len, size_t offset, int64_t* line, int64_t* column);


  //
  // SceneBuilder class declaration
  //

  enum class ScopeKind : uint32_t {
    Attribute,
    Transform,
    Object,
  };


  /// Everything that AttributeBegin/AttributeEnd saves and restores.
  struct GraphicsState {
    Mat4 ctm;
    bool reverseOrientation = false;
    std::string insideMedium;
    std::string outsideMedium;
    uint32_t material       = kInvalidIndex;
    uint32_t areaLight      = kInvalidIndex;

    // Params from `Attribute` directives, inherited by the matching resource
    // directives in this scope.
    ParamList shapeAttrs;
    ParamList lightAttrs;
    ParamList materialAttrs;
    ParamList mediumAttrs;
    ParamList textureAttrs;

    GraphicsState() { ctm.identity(); }
  };


  /// Runs directives against the graphics state and builds up a `Scene`.
  /// Included files are handled with an explicit stack of parsers, one per
  /// open file.
  class SceneBuilder {
  public:
    SceneBuilder();
    ~SceneBuilder();

    SceneBuilder(const SceneBuilder&) = delete;
    SceneBuilder& operator = (const SceneBuilder&) = delete;

    /// 0 means no include files allowed, any attempt to include a file will fail
    /// 1 means the original file can include a file, but they can't include any files.
    /// 2 means the original file can include A and A can include B, but B can't include anything.
    /// ...and so on.
    void set_max_include_depth(uint32_t n);

    bool load_file(const char* filename);
    bool load_buffer(const char* text, size_t len, const char* baseDir);

    /// Run a single directive. Errors are reported against the innermost
    /// open file, if there is one.
    bool apply(const Directive& directive);

    /// Checks for conditions which are only errors once all input has been
    /// seen: unclosed scopes and a missing WorldBegin.
    bool finish();

    const GraphicsState& state() const;
    uint32_t scope_depth() const;
    const Mat4* named_coordinate_system(const char* name) const;
    uint32_t named_material(const char* name) const;
    uint32_t named_medium(const char* name) const;
    uint32_t float_texture(const char* name) const;
    uint32_t spectrum_texture(const char* name) const;
    bool in_world() const;

    Scene* take_scene();
    Scene* borrow_scene();

    bool has_error() const;
    const Error* error() const;

  private:
    struct PushedState {
      ScopeKind kind;
      GraphicsState state;
    };

  private:
    bool run();
    bool drain(size_t stopDepth);
    void reset();
    void release_buffers();
    bool push_file(const std::string& path);
    bool push_buffer(char* text, size_t len, const std::string& filename);

    bool set_error(ErrorCode code, const char* fmt, ...);

    bool push_scope(ScopeKind kind);
    bool pop_scope(ScopeKind kind, const char* directive);

    bool apply_Option(const Directive& d);
    bool apply_ColorSpace(const Directive& d);
    bool apply_Camera(const Directive& d);
    bool apply_Shape(const Directive& d);
    bool apply_Material(const Directive& d);
    bool apply_MakeNamedMaterial(const Directive& d);
    bool apply_Texture(const Directive& d);
    bool apply_LightSource(const Directive& d);
    bool apply_AreaLightSource(const Directive& d);
    bool apply_MakeNamedMedium(const Directive& d);
    bool apply_Attribute(const Directive& d);
    bool apply_ObjectBegin(const Directive& d);
    bool apply_ObjectEnd(const Directive& d);
    bool apply_ObjectInstance(const Directive& d);
    bool apply_Include(const Directive& d);

    bool creation_failed(const char* what, const std::string& typeName, const CreateError& err);
    TextureLookup texture_lookup() const;
    uint32_t find_medium(const std::string& name) const;

  private:
    uint32_t m_maxIncludeDepth = kDefaultMaxIncludeDepth;
    std::string m_baseDir;

    std::vector<DirectiveParser*> m_parsers; // One per open file, innermost last.
    std::vector<char*> m_buffers;            // Every buffer loaded, kept until the load is finished.
    std::string m_rootFilename;
    const char* m_rootText = nullptr;
    size_t m_rootLen       = 0;

    GraphicsState m_state;
    std::vector<PushedState> m_stack;
    std::unordered_map<std::string, Mat4> m_namedCoordinateSystems;

    NameToIndex m_namedMaterials;
    NameToIndex m_namedMediums;
    NameToIndex m_floatTextures;
    NameToIndex m_spectrumTextures;
    NameToIndex m_objects;

    uint32_t m_activeObject  = kInvalidIndex;
    bool m_inWorld           = false;
    size_t m_directiveOffset = 0; // Errors from `apply` are reported at this offset.

    Scene* m_scene = nullptr;
    Error* m_error = nullptr;
  };


  //
  // Loader class declaration
  //

  class Loader {
  public:
    Loader();
    ~Loader();

    Loader(const Loader&) = delete;
    Loader& operator = (const Loader&) = delete;

    void set_max_include_depth(uint32_t n);

    bool load(const char* filename);

    /// Load from text in memory. Relative `Include` paths are resolved
    /// against `baseDir`, which may be null or empty for the current
    /// directory. The text is copied so it doesn't have to outlive the call.
    bool load_from_buffer(const char* text, size_t len, const char* baseDir);

    Scene* take_scene();
    Scene* borrow_scene();

    const Error* error() const;

  private:
    Scene* m_scene;
    SceneBuilder* m_builder;
  };

} // namespace pbrtscene

#endif // PBRTSCENE_H
