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

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>


namespace pbrtscene {

  //
  // Type names
  //

  // Each of these must be in the same order as the matching enum.
  static const char* kAcceleratorTypes[] = { "bvh", "kdtree", nullptr };
  static const char* kAreaLightTypes[] = { "diffuse", nullptr };
  static const char* kCameraTypes[] = { "perspective", "orthographic", "spherical", "realistic", nullptr };
  static const char* kFilmTypes[] = { "rgb", "gbuffer", "spectral", nullptr };
  static const char* kFilterTypes[] = { "box", "gaussian", "mitchell", "sinc", "triangle", nullptr };
  static const char* kIntegratorTypes[] = { "ambientocclusion", "bdpt", "lightpath", "mlt", "path", "randomwalk", "simplepath", "simplevolpath", "sppm", "volpath", nullptr };
  static const char* kLightTypes[] = { "distant", "goniometric", "infinite", "point", "projection", "spot", nullptr };
  static const char* kMaterialTypes[] = { "coatedconductor", "coateddiffuse", "conductor", "dielectric", "diffuse", "diffusetransmission", "hair", "interface", "measured", "mix", "subsurface", "thindielectric", nullptr };
  static const char* kMediumTypes[] = { "homogeneous", "uniformgrid", "cloud", "nanovdb", nullptr };
  static const char* kSamplerTypes[] = { "halton", "independent", "paddedsobol", "pmj02bn", "sobol", "stratified", "zsobol", nullptr };
  static const char* kShapeTypes[] = { "bilinearmesh", "curve", "cylinder", "disk", "loopsubdiv", "plymesh", "sphere", "trianglemesh", nullptr };
  static const char* kTextureTypes[] = { "bilerp", "checkerboard", "constant", "directionmix", "dots", "fbm", "imagemap", "marble", "mix", "ptex", "scale", "windy", "wrinkled", nullptr };

  static const char* kBVHSplitMethods[] = { "sah", "middle", "equal", "hlbvh", nullptr };
  static const char* kSphericalMappings[] = { "equalarea", "equirectangular", nullptr };
  static const char* kCurveBases[] = { "bezier", "bspline", nullptr };
  static const char* kCurveTypes[] = { "flat", "ribbon", "cylinder", nullptr };
  static const char* kTexCoordMappings[] = { "uv", "spherical", "cylindrical", "planar", nullptr };
  static const char* kWrapModes[] = { "repeat", "black", "clamp", "octahedralsphere", nullptr };


  //
  // Public functions
  //

  const char* type_name(AcceleratorType type) { return name_in_array(kAcceleratorTypes, type); }
  const char* type_name(AreaLightType type)   { return name_in_array(kAreaLightTypes, type); }
  const char* type_name(CameraType type)      { return name_in_array(kCameraTypes, type); }
  const char* type_name(FilmType type)        { return name_in_array(kFilmTypes, type); }
  const char* type_name(FilterType type)      { return name_in_array(kFilterTypes, type); }
  const char* type_name(IntegratorType type)  { return name_in_array(kIntegratorTypes, type); }
  const char* type_name(LightType type)       { return name_in_array(kLightTypes, type); }
  const char* type_name(MaterialType type)    { return name_in_array(kMaterialTypes, type); }
  const char* type_name(MediumType type)      { return name_in_array(kMediumTypes, type); }
  const char* type_name(SamplerType type)     { return name_in_array(kSamplerTypes, type); }
  const char* type_name(ShapeType type)       { return name_in_array(kShapeTypes, type); }
  const char* type_name(TextureType type)     { return name_in_array(kTextureTypes, type); }

  const char* type_name(BVHSplit split)             { return name_in_array(kBVHSplitMethods, split); }
  const char* type_name(SphericalMapping mapping)   { return name_in_array(kSphericalMappings, mapping); }


  //
  // ParamReader class
  //

  /// Reads typed values out of a merged param list. Every accessor returns
  /// true if the param was present and leaves `dest` untouched otherwise, so
  /// the entity's defaults stand. Params of an unexpected type are ignored.
  /// Invalid values record an error in the `CreateError` and the first one
  /// wins.
  class ParamReader {
  public:
    ParamReader(const ParamList& params, const TextureLookup* textures, CreateError* err);

    bool failed() const;
    void fail(ErrorCode code, const char* fmt, ...);

    bool float_param(const char* name, float* dest);
    bool int_param(const char* name, int* dest);
    bool bool_param(const char* name, bool* dest);
    bool string_param(const char* name, std::string* dest);
    bool required_string_param(const char* name, std::string* dest);
    bool float_array_param(const char* name, uint32_t len, float* dest);
    bool float_vector_param(const char* name, std::vector<float>* dest);
    bool int_vector_param(const char* name, std::vector<int>* dest);
    bool spectrum_param(const char* name, Spectrum* dest);
    bool float_texture_param(const char* name, FloatTex* dest);
    bool color_texture_param(const char* name, ColorTex* dest);
    bool value_texture_param(const char* name, TextureData dataType, ColorTex* dest);
    bool named_material_param(const char* name, uint32_t* dest);

    template <class T>
    bool typed_enum_param(const char* name, const char* values[], T* dest)
    {
      std::string value;
      if (!string_param(name, &value)) {
        return false;
      }
      int index = find_string_in_array(value.c_str(), values);
      if (index < 0) {
        fail(ErrorCode::InvalidParamValue, "Invalid value \"%s\" for parameter \"%s\"", value.c_str(), name);
        return false;
      }
      *dest = static_cast<T>(index);
      return true;
    }

  private:
    const Param* find(const char* name, ParamType type) const;
    uint32_t find_texture(const std::string& texName, TextureData dataType) const;

  private:
    const ParamList& m_params;
    const TextureLookup* m_textures;
    CreateError* m_err;
  };


  ParamReader::ParamReader(const ParamList& params, const TextureLookup* textures, CreateError* err) :
    m_params(params),
    m_textures(textures),
    m_err(err)
  {
    m_err->code = ErrorCode::None;
    m_err->message.clear();
  }


  bool ParamReader::failed() const
  {
    return m_err->code != ErrorCode::None;
  }


  void ParamReader::fail(ErrorCode code, const char* fmt, ...)
  {
    if (failed()) {
      return;
    }

    va_list args;
    va_start(args, fmt);
    int len = vsnprintf(nullptr, 0, fmt, args);
    va_end(args);

    m_err->code = code;
    if (len <= 0) {
      m_err->message = fmt;
      return;
    }

    std::vector<char> buf(size_t(len + 1));
    va_start(args, fmt);
    vsnprintf(buf.data(), buf.size(), fmt, args);
    va_end(args);
    m_err->message.assign(buf.data(), size_t(len));
  }


  bool ParamReader::float_param(const char* name, float* dest)
  {
    const Param* param = find(name, ParamType::Float);
    if (param == nullptr || param->count() == 0) {
      return false;
    }
    *dest = param->floats()->front();
    return true;
  }


  bool ParamReader::int_param(const char* name, int* dest)
  {
    const Param* param = find(name, ParamType::Int);
    if (param == nullptr || param->count() == 0) {
      return false;
    }
    *dest = param->ints()->front();
    return true;
  }


  bool ParamReader::bool_param(const char* name, bool* dest)
  {
    const Param* param = find(name, ParamType::Bool);
    if (param == nullptr || param->count() == 0) {
      return false;
    }
    *dest = param->bools()->front();
    return true;
  }


  bool ParamReader::string_param(const char* name, std::string* dest)
  {
    const Param* param = find(name, ParamType::String);
    if (param == nullptr || param->count() == 0) {
      return false;
    }
    *dest = param->strings()->front();
    return true;
  }


  bool ParamReader::required_string_param(const char* name, std::string* dest)
  {
    if (string_param(name, dest)) {
      return true;
    }
    fail(ErrorCode::MissingParam, "Required parameter \"string %s\" is missing", name);
    return false;
  }


  bool ParamReader::float_array_param(const char* name, uint32_t len, float* dest)
  {
    const Param* param = m_params.find(name);
    if (param == nullptr || param->floats() == nullptr) {
      return false;
    }
    if (param->count() != len) {
      fail(ErrorCode::InvalidParamValue, "Parameter \"%s\" needs %u values but has %u", name, len, param->count());
      return false;
    }
    std::memcpy(dest, param->floats()->data(), sizeof(float) * len);
    return true;
  }


  bool ParamReader::float_vector_param(const char* name, std::vector<float>* dest)
  {
    const Param* param = m_params.find(name);
    if (param == nullptr || param->floats() == nullptr) {
      return false;
    }
    *dest = *param->floats();
    return true;
  }


  bool ParamReader::int_vector_param(const char* name, std::vector<int>* dest)
  {
    const Param* param = find(name, ParamType::Int);
    if (param == nullptr) {
      return false;
    }
    *dest = *param->ints();
    return true;
  }


  bool ParamReader::spectrum_param(const char* name, Spectrum* dest)
  {
    const Param* param = m_params.find(name);
    if (param == nullptr) {
      return false;
    }
    if (param->type() != ParamType::RGB && param->type() != ParamType::Blackbody) {
      // Sampled and named spectra aren't converted, the default stands.
      return false;
    }
    if (!param->spectrum(dest)) {
      fail(ErrorCode::InvalidParamValue, "Parameter \"%s %s\" has the wrong number of values",
           param_type_name(param->type()), name);
      return false;
    }
    return true;
  }


  bool ParamReader::float_texture_param(const char* name, FloatTex* dest)
  {
    const Param* param = m_params.find(name);
    if (param == nullptr) {
      return false;
    }
    if (param->type() == ParamType::Texture) {
      if (param->count() == 0) {
        return false;
      }
      const std::string& texName = param->strings()->front();
      uint32_t tex = find_texture(texName, TextureData::Float);
      if (tex == kInvalidIndex) {
        fail(ErrorCode::UnknownTexture, "Parameter \"%s\" refers to an undefined float texture \"%s\"", name, texName.c_str());
        return false;
      }
      dest->texture = tex;
      return true;
    }
    return float_param(name, &dest->value);
  }


  bool ParamReader::color_texture_param(const char* name, ColorTex* dest)
  {
    const Param* param = m_params.find(name);
    if (param == nullptr) {
      return false;
    }
    if (param->type() == ParamType::Texture) {
      if (param->count() == 0) {
        return false;
      }
      const std::string& texName = param->strings()->front();
      uint32_t tex = find_texture(texName, TextureData::Spectrum);
      if (tex == kInvalidIndex) {
        fail(ErrorCode::UnknownTexture, "Parameter \"%s\" refers to an undefined spectrum texture \"%s\"", name, texName.c_str());
        return false;
      }
      dest->texture = tex;
      return true;
    }
    return spectrum_param(name, &dest->value);
  }


  // Textures of either data type store their values as a ColorTex. A float
  // value is copied into all three channels.
  bool ParamReader::value_texture_param(const char* name, TextureData dataType, ColorTex* dest)
  {
    if (dataType == TextureData::Spectrum) {
      return color_texture_param(name, dest);
    }

    FloatTex tmp = { kInvalidIndex, dest->value.rgb[0] };
    if (!float_texture_param(name, &tmp)) {
      return false;
    }
    dest->texture = tmp.texture;
    dest->value = rgb_spectrum(tmp.value, tmp.value, tmp.value);
    return true;
  }


  bool ParamReader::named_material_param(const char* name, uint32_t* dest)
  {
    std::string matName;
    if (!string_param(name, &matName)) {
      return false;
    }
    if (m_textures == nullptr || m_textures->namedMaterials == nullptr) {
      fail(ErrorCode::InvalidParamValue, "Parameter \"%s\" refers to an undefined material \"%s\"", name, matName.c_str());
      return false;
    }
    auto it = m_textures->namedMaterials->find(matName);
    if (it == m_textures->namedMaterials->end()) {
      fail(ErrorCode::InvalidParamValue, "Parameter \"%s\" refers to an undefined material \"%s\"", name, matName.c_str());
      return false;
    }
    *dest = it->second;
    return true;
  }


  const Param* ParamReader::find(const char* name, ParamType type) const
  {
    const Param* param = m_params.find(name);
    return (param != nullptr && param->type() == type) ? param : nullptr;
  }


  uint32_t ParamReader::find_texture(const std::string& texName, TextureData dataType) const
  {
    if (m_textures == nullptr) {
      return kInvalidIndex;
    }
    const NameToIndex* names = (dataType == TextureData::Float) ? m_textures->floatTextures : m_textures->spectrumTextures;
    if (names == nullptr) {
      return kInvalidIndex;
    }
    auto it = names->find(texName);
    return (it != names->end()) ? it->second : kInvalidIndex;
  }


  //
  // Accelerator creation
  //

  Accelerator* create_accelerator(const std::string& typeName, const ParamList& params, CreateError* err)
  {
    ParamReader reader(params, nullptr, err);
    int typeIdx = find_string_in_array(typeName.c_str(), kAcceleratorTypes);
    if (typeIdx < 0) {
      reader.fail(ErrorCode::UnknownType, "Unknown accelerator type \"%s\"", typeName.c_str());
      return nullptr;
    }

    Accelerator* accel = nullptr;
    switch (static_cast<AcceleratorType>(typeIdx)) {
    case AcceleratorType::BVH:
      {
        BVHAccelerator* bvh = new BVHAccelerator();
        reader.int_param("maxnodeprims", &bvh->maxnodeprims);
        reader.typed_enum_param("splitmethod", kBVHSplitMethods, &bvh->splitmethod);
        accel = bvh;
      }
      break;

    case AcceleratorType::KdTree:
      {
        KdTreeAccelerator* kdtree = new KdTreeAccelerator();
        reader.int_param("intersectcost", &kdtree->intersectcost);
        reader.int_param("traversalcost", &kdtree->traversalcost);
        reader.float_param("emptybonus", &kdtree->emptybonus);
        reader.int_param("maxprims", &kdtree->maxprims);
        reader.int_param("maxdepth", &kdtree->maxdepth);
        accel = kdtree;
      }
      break;
    }

    if (reader.failed()) {
      delete accel;
      return nullptr;
    }
    return accel;
  }


  //
  // Camera creation
  //

  Camera* create_camera(const std::string& typeName, const ParamList& params, CreateError* err)
  {
    ParamReader reader(params, nullptr, err);
    int typeIdx = find_string_in_array(typeName.c_str(), kCameraTypes);
    if (typeIdx < 0) {
      reader.fail(ErrorCode::UnknownType, "Unknown camera type \"%s\"", typeName.c_str());
      return nullptr;
    }

    Camera* camera = nullptr;
    switch (static_cast<CameraType>(typeIdx)) {
    case CameraType::Perspective:
      {
        PerspectiveCamera* perspective = new PerspectiveCamera();
        reader.float_param("fov", &perspective->fov);
        camera = perspective;
      }
      break;

    case CameraType::Orthographic:
      camera = new OrthographicCamera();
      break;

    case CameraType::Spherical:
      {
        SphericalCamera* spherical = new SphericalCamera();
        reader.typed_enum_param("mapping", kSphericalMappings, &spherical->mapping);
        camera = spherical;
      }
      break;

    case CameraType::Realistic:
      {
        RealisticCamera* realistic = new RealisticCamera();
        reader.string_param("lensfile", &realistic->lensfile);
        reader.float_param("aperturediameter", &realistic->aperturediameter);
        reader.float_param("focusdistance", &realistic->focusdistance);
        reader.string_param("aperture", &realistic->aperture);
        camera = realistic;
      }
      break;
    }

    ProjectiveCamera* projective = dynamic_cast<ProjectiveCamera*>(camera);
    if (projective != nullptr) {
      reader.float_param("frameaspectratio", &projective->frameaspectratio);
      reader.float_array_param("screenwindow", 4, projective->screenwindow);
      reader.float_param("lensradius", &projective->lensradius);
      reader.float_param("focaldistance", &projective->focaldistance);
    }

    reader.float_param("shutteropen", &camera->shutteropen);
    reader.float_param("shutterclose", &camera->shutterclose);

    if (reader.failed()) {
      delete camera;
      return nullptr;
    }
    return camera;
  }


  //
  // Film creation
  //

  Film* create_film(const std::string& typeName, const ParamList& params, CreateError* err)
  {
    ParamReader reader(params, nullptr, err);
    int typeIdx = find_string_in_array(typeName.c_str(), kFilmTypes);
    if (typeIdx < 0) {
      reader.fail(ErrorCode::UnknownType, "Unknown film type \"%s\"", typeName.c_str());
      return nullptr;
    }

    Film* film = nullptr;
    switch (static_cast<FilmType>(typeIdx)) {
    case FilmType::RGB:
      film = new RGBFilm();
      break;

    case FilmType::GBuffer:
      {
        GBufferFilm* gbuffer = new GBufferFilm();
        reader.string_param("coordinatesystem", &gbuffer->coordinatesystem);
        film = gbuffer;
      }
      break;

    case FilmType::Spectral:
      {
        SpectralFilm* spectral = new SpectralFilm();
        reader.int_param("nbuckets", &spectral->nbuckets);
        reader.float_param("lambdamin", &spectral->lambdamin);
        reader.float_param("lambdamax", &spectral->lambdamax);
        film = spectral;
      }
      break;
    }

    reader.int_param("xresolution", &film->xresolution);
    reader.int_param("yresolution", &film->yresolution);
    reader.float_array_param("cropwindow", 4, film->cropwindow);
    reader.float_param("diagonal", &film->diagonal);
    reader.string_param("filename", &film->filename);
    reader.bool_param("savefp16", &film->savefp16);
    reader.float_param("iso", &film->iso);
    reader.float_param("whitebalance", &film->whitebalance);
    reader.string_param("sensor", &film->sensor);
    reader.float_param("maxcomponentvalue", &film->maxcomponentvalue);

    if (reader.failed()) {
      delete film;
      return nullptr;
    }
    return film;
  }


  //
  // Filter creation
  //

  Filter* create_filter(const std::string& typeName, const ParamList& params, CreateError* err)
  {
    ParamReader reader(params, nullptr, err);
    int typeIdx = find_string_in_array(typeName.c_str(), kFilterTypes);
    if (typeIdx < 0) {
      reader.fail(ErrorCode::UnknownType, "Unknown pixel filter type \"%s\"", typeName.c_str());
      return nullptr;
    }

    Filter* filter = nullptr;
    switch (static_cast<FilterType>(typeIdx)) {
    case FilterType::Box:
      filter = new BoxFilter();
      break;

    case FilterType::Gaussian:
      {
        GaussianFilter* gaussian = new GaussianFilter();
        reader.float_param("sigma", &gaussian->sigma);
        filter = gaussian;
      }
      break;

    case FilterType::Mitchell:
      {
        MitchellFilter* mitchell = new MitchellFilter();
        reader.float_param("B", &mitchell->B);
        reader.float_param("C", &mitchell->C);
        filter = mitchell;
      }
      break;

    case FilterType::Sinc:
      {
        SincFilter* sinc = new SincFilter();
        reader.float_param("tau", &sinc->tau);
        filter = sinc;
      }
      break;

    case FilterType::Triangle:
      filter = new TriangleFilter();
      break;
    }

    reader.float_param("xradius", &filter->xradius);
    reader.float_param("yradius", &filter->yradius);

    if (reader.failed()) {
      delete filter;
      return nullptr;
    }
    return filter;
  }


  //
  // Integrator creation
  //

  Integrator* create_integrator(const std::string& typeName, const ParamList& params, CreateError* err)
  {
    ParamReader reader(params, nullptr, err);
    int typeIdx = find_string_in_array(typeName.c_str(), kIntegratorTypes);
    if (typeIdx < 0) {
      reader.fail(ErrorCode::UnknownType, "Unknown integrator type \"%s\"", typeName.c_str());
      return nullptr;
    }

    Integrator* integrator = nullptr;
    switch (static_cast<IntegratorType>(typeIdx)) {
    case IntegratorType::AmbientOcclusion:
      {
        AOIntegrator* ao = new AOIntegrator();
        reader.bool_param("cossample", &ao->cossample);
        reader.float_param("maxdistance", &ao->maxdistance);
        integrator = ao;
      }
      break;

    case IntegratorType::BDPT:
      {
        BDPTIntegrator* bdpt = new BDPTIntegrator();
        reader.bool_param("visualizestrategies", &bdpt->visualizestrategies);
        reader.bool_param("visualizeweights", &bdpt->visualizeweights);
        integrator = bdpt;
      }
      break;

    case IntegratorType::LightPath:
      integrator = new LightPathIntegrator();
      break;

    case IntegratorType::MLT:
      {
        MLTIntegrator* mlt = new MLTIntegrator();
        reader.int_param("bootstrapsamples", &mlt->bootstrapsamples);
        reader.int_param("chains", &mlt->chains);
        reader.int_param("mutationsperpixel", &mlt->mutationsperpixel);
        reader.float_param("largestepprobability", &mlt->largestepprobability);
        reader.float_param("sigma", &mlt->sigma);
        integrator = mlt;
      }
      break;

    case IntegratorType::Path:
      integrator = new PathIntegrator();
      break;

    case IntegratorType::RandomWalk:
      integrator = new RandomWalkIntegrator();
      break;

    case IntegratorType::SimplePath:
      {
        SimplePathIntegrator* simplepath = new SimplePathIntegrator();
        reader.bool_param("samplelights", &simplepath->samplelights);
        reader.bool_param("samplebsdf", &simplepath->samplebsdf);
        integrator = simplepath;
      }
      break;

    case IntegratorType::SimpleVolPath:
      integrator = new SimpleVolPathIntegrator();
      break;

    case IntegratorType::SPPM:
      {
        SPPMIntegrator* sppm = new SPPMIntegrator();
        reader.int_param("iterations", &sppm->iterations);
        reader.int_param("photonsperiteration", &sppm->photonsperiteration);
        reader.float_param("radius", &sppm->radius);
        reader.int_param("seed", &sppm->seed);
        integrator = sppm;
      }
      break;

    case IntegratorType::VolPath:
      integrator = new VolPathIntegrator();
      break;
    }

    reader.int_param("maxdepth", &integrator->maxdepth);
    reader.bool_param("regularize", &integrator->regularize);
    reader.string_param("lightsampler", &integrator->lightsampler);

    if (reader.failed()) {
      delete integrator;
      return nullptr;
    }
    return integrator;
  }


  //
  // Sampler creation
  //

  Sampler* create_sampler(const std::string& typeName, const ParamList& params, CreateError* err)
  {
    ParamReader reader(params, nullptr, err);
    int typeIdx = find_string_in_array(typeName.c_str(), kSamplerTypes);
    if (typeIdx < 0) {
      reader.fail(ErrorCode::UnknownType, "Unknown sampler type \"%s\"", typeName.c_str());
      return nullptr;
    }

    Sampler* sampler = nullptr;
    switch (static_cast<SamplerType>(typeIdx)) {
    case SamplerType::Halton:
      {
        HaltonSampler* halton = new HaltonSampler();
        reader.string_param("randomization", &halton->randomization);
        sampler = halton;
      }
      break;

    case SamplerType::Independent:
      sampler = new IndependentSampler();
      break;

    case SamplerType::PaddedSobol:
      {
        PaddedSobolSampler* paddedsobol = new PaddedSobolSampler();
        reader.string_param("randomization", &paddedsobol->randomization);
        sampler = paddedsobol;
      }
      break;

    case SamplerType::PMJ02BN:
      sampler = new PMJ02BNSampler();
      break;

    case SamplerType::Sobol:
      {
        SobolSampler* sobol = new SobolSampler();
        reader.string_param("randomization", &sobol->randomization);
        sampler = sobol;
      }
      break;

    case SamplerType::Stratified:
      {
        StratifiedSampler* stratified = new StratifiedSampler();
        reader.bool_param("jitter", &stratified->jitter);
        reader.int_param("xsamples", &stratified->xsamples);
        reader.int_param("ysamples", &stratified->ysamples);
        stratified->pixelsamples = stratified->xsamples * stratified->ysamples;
        sampler = stratified;
      }
      break;

    case SamplerType::ZSobol:
      {
        ZSobolSampler* zsobol = new ZSobolSampler();
        reader.string_param("randomization", &zsobol->randomization);
        sampler = zsobol;
      }
      break;
    }

    if (sampler->type() != SamplerType::Stratified) {
      reader.int_param("pixelsamples", &sampler->pixelsamples);
    }
    reader.int_param("seed", &sampler->seed);

    if (reader.failed()) {
      delete sampler;
      return nullptr;
    }
    return sampler;
  }


  //
  // Shape creation
  //

  // Checks that `indices` is a whole number of faces and refers only to
  // vertices which exist.
  static bool check_indices(ParamReader& reader, const std::vector<int>& indices, size_t vertsPerFace, size_t numVerts)
  {
    if (indices.size() % vertsPerFace != 0) {
      reader.fail(ErrorCode::InvalidParamValue, "Number of indices (%u) is not a multiple of %u",
                  uint32_t(indices.size()), uint32_t(vertsPerFace));
      return false;
    }
    for (int idx : indices) {
      if (idx < 0 || size_t(idx) >= numVerts) {
        reader.fail(ErrorCode::InvalidParamValue, "Vertex index %d is out of range, there are %u vertices", idx, uint32_t(numVerts));
        return false;
      }
    }
    return true;
  }


  // Reads the positions and indices of a polygon mesh. A mesh with exactly
  // one face may leave out its indices.
  static bool mesh_params(ParamReader& reader, size_t vertsPerFace, std::vector<float>* P, std::vector<int>* indices)
  {
    if (!reader.float_vector_param("P", P) || P->empty()) {
      reader.fail(ErrorCode::MissingParam, "Required parameter \"point3 P\" is missing");
      return false;
    }
    if (P->size() % 3 != 0) {
      reader.fail(ErrorCode::InvalidParamValue, "Number of values in \"P\" is not a multiple of 3");
      return false;
    }
    size_t numVerts = P->size() / 3;
    if (!reader.int_vector_param("indices", indices)) {
      if (numVerts != vertsPerFace) {
        reader.fail(ErrorCode::MissingParam, "Required parameter \"integer indices\" is missing");
        return false;
      }
      for (size_t i = 0; i < vertsPerFace; i++) {
        indices->push_back(int(i));
      }
    }
    return check_indices(reader, *indices, vertsPerFace, numVerts);
  }


  Shape* create_shape(const std::string& typeName, const ParamList& params, const TextureLookup& textures, CreateError* err)
  {
    ParamReader reader(params, &textures, err);
    int typeIdx = find_string_in_array(typeName.c_str(), kShapeTypes);
    if (typeIdx < 0) {
      reader.fail(ErrorCode::UnknownType, "Unknown shape type \"%s\"", typeName.c_str());
      return nullptr;
    }

    Shape* shape = nullptr;
    switch (static_cast<ShapeType>(typeIdx)) {
    case ShapeType::BilinearMesh:
      {
        BilinearMesh* bilinearmesh = new BilinearMesh();
        mesh_params(reader, 4, &bilinearmesh->P, &bilinearmesh->indices);
        reader.float_vector_param("N", &bilinearmesh->N);
        reader.float_vector_param("uv", &bilinearmesh->uv);
        shape = bilinearmesh;
      }
      break;

    case ShapeType::Curve:
      {
        Curve* curve = new Curve();
        if (!reader.float_vector_param("P", &curve->P) || curve->P.empty()) {
          reader.fail(ErrorCode::MissingParam, "Required parameter \"point3 P\" is missing");
        }
        reader.typed_enum_param("basis", kCurveBases, &curve->basis);
        if (reader.int_param("degree", &curve->degree) && (curve->degree < 2 || curve->degree > 3)) {
          reader.fail(ErrorCode::InvalidParamValue, "Invalid value for \"degree\" parameter, must be either 2 or 3");
        }
        reader.typed_enum_param("type", kCurveTypes, &curve->curvetype);
        reader.float_vector_param("N", &curve->N);
        float width;
        if (reader.float_param("width", &width)) {
          curve->width0 = curve->width1 = width;
        }
        reader.float_param("width0", &curve->width0);
        reader.float_param("width1", &curve->width1);
        reader.int_param("splitdepth", &curve->splitdepth);
        shape = curve;
      }
      break;

    case ShapeType::Cylinder:
      {
        Cylinder* cylinder = new Cylinder();
        reader.float_param("radius", &cylinder->radius);
        reader.float_param("zmin", &cylinder->zmin);
        reader.float_param("zmax", &cylinder->zmax);
        reader.float_param("phimax", &cylinder->phimax);
        shape = cylinder;
      }
      break;

    case ShapeType::Disk:
      {
        Disk* disk = new Disk();
        reader.float_param("height", &disk->height);
        reader.float_param("radius", &disk->radius);
        reader.float_param("innerradius", &disk->innerradius);
        reader.float_param("phimax", &disk->phimax);
        shape = disk;
      }
      break;

    case ShapeType::LoopSubdiv:
      {
        LoopSubdiv* loopsubdiv = new LoopSubdiv();
        reader.int_param("levels", &loopsubdiv->levels);
        mesh_params(reader, 3, &loopsubdiv->P, &loopsubdiv->indices);
        shape = loopsubdiv;
      }
      break;

    case ShapeType::PLYMesh:
      {
        PLYMesh* plymesh = new PLYMesh();
        reader.required_string_param("filename", &plymesh->filename);
        plymesh->hasDisplacement = reader.float_texture_param("displacement", &plymesh->displacement);
        reader.float_param("edgelength", &plymesh->edgelength);
        shape = plymesh;
      }
      break;

    case ShapeType::Sphere:
      {
        Sphere* sphere = new Sphere();
        reader.float_param("radius", &sphere->radius);
        sphere->zmin = -sphere->radius;
        sphere->zmax = sphere->radius;
        reader.float_param("zmin", &sphere->zmin);
        reader.float_param("zmax", &sphere->zmax);
        reader.float_param("phimax", &sphere->phimax);
        shape = sphere;
      }
      break;

    case ShapeType::TriangleMesh:
      {
        TriangleMesh* trianglemesh = new TriangleMesh();
        if (mesh_params(reader, 3, &trianglemesh->P, &trianglemesh->indices)) {
          size_t numVerts = trianglemesh->P.size() / 3;
          if (reader.float_vector_param("N", &trianglemesh->N) && trianglemesh->N.size() != numVerts * 3) {
            reader.fail(ErrorCode::InvalidParamValue, "Expected %u normals but got %u", uint32_t(numVerts), uint32_t(trianglemesh->N.size() / 3));
          }
          if (reader.float_vector_param("S", &trianglemesh->S) && trianglemesh->S.size() != numVerts * 3) {
            reader.fail(ErrorCode::InvalidParamValue, "Expected %u tangents but got %u", uint32_t(numVerts), uint32_t(trianglemesh->S.size() / 3));
          }
          if (reader.float_vector_param("uv", &trianglemesh->uv) && trianglemesh->uv.size() != numVerts * 2) {
            reader.fail(ErrorCode::InvalidParamValue, "Expected %u uvs but got %u", uint32_t(numVerts), uint32_t(trianglemesh->uv.size() / 2));
          }
          reader.int_vector_param("faceIndices", &trianglemesh->faceIndices);
        }
        shape = trianglemesh;
      }
      break;
    }

    reader.float_texture_param("alpha", &shape->alpha);
    reader.string_param("emissionfilename", &shape->emissionfilename);

    if (reader.failed()) {
      delete shape;
      return nullptr;
    }
    return shape;
  }


  //
  // Light creation
  //

  Light* create_light(const std::string& typeName, const ParamList& params, CreateError* err)
  {
    ParamReader reader(params, nullptr, err);
    int typeIdx = find_string_in_array(typeName.c_str(), kLightTypes);
    if (typeIdx < 0) {
      reader.fail(ErrorCode::UnknownType, "Unknown light type \"%s\"", typeName.c_str());
      return nullptr;
    }

    Light* light = nullptr;
    switch (static_cast<LightType>(typeIdx)) {
    case LightType::Distant:
      {
        DistantLight* distant = new DistantLight();
        reader.spectrum_param("L", &distant->L);
        reader.float_array_param("from", 3, distant->from);
        reader.float_array_param("to", 3, distant->to);
        light = distant;
      }
      break;

    case LightType::Goniometric:
      {
        GoniometricLight* goniometric = new GoniometricLight();
        reader.spectrum_param("I", &goniometric->I);
        reader.string_param("filename", &goniometric->filename);
        light = goniometric;
      }
      break;

    case LightType::Infinite:
      {
        InfiniteLight* infinite = new InfiniteLight();
        infinite->hasL = reader.spectrum_param("L", &infinite->L);
        reader.string_param("filename", &infinite->filename);
        if (infinite->hasL && !infinite->filename.empty()) {
          reader.fail(ErrorCode::InvalidParamValue, "Can't specify both \"L\" and \"filename\" for an infinite light");
        }
        if (reader.float_vector_param("portal", &infinite->portal) && infinite->portal.size() != 12) {
          reader.fail(ErrorCode::InvalidParamValue, "Parameter \"portal\" needs 4 points");
        }
        reader.float_param("illuminance", &infinite->illuminance);
        light = infinite;
      }
      break;

    case LightType::Point:
      {
        PointLight* point = new PointLight();
        reader.spectrum_param("I", &point->I);
        reader.float_array_param("from", 3, point->from);
        light = point;
      }
      break;

    case LightType::Projection:
      {
        ProjectionLight* projection = new ProjectionLight();
        reader.float_param("fov", &projection->fov);
        reader.string_param("filename", &projection->filename);
        light = projection;
      }
      break;

    case LightType::Spot:
      {
        SpotLight* spot = new SpotLight();
        reader.spectrum_param("I", &spot->I);
        reader.float_array_param("from", 3, spot->from);
        reader.float_array_param("to", 3, spot->to);
        reader.float_param("coneangle", &spot->coneangle);
        reader.float_param("conedelta", &spot->conedelta);
        light = spot;
      }
      break;
    }

    reader.float_param("scale", &light->scale);
    reader.float_param("power", &light->power);

    if (reader.failed()) {
      delete light;
      return nullptr;
    }
    return light;
  }


  AreaLight* create_area_light(const std::string& typeName, const ParamList& params, CreateError* err)
  {
    ParamReader reader(params, nullptr, err);
    int typeIdx = find_string_in_array(typeName.c_str(), kAreaLightTypes);
    if (typeIdx < 0) {
      reader.fail(ErrorCode::UnknownType, "Unknown area light type \"%s\"", typeName.c_str());
      return nullptr;
    }

    DiffuseAreaLight* diffuse = new DiffuseAreaLight();
    reader.spectrum_param("L", &diffuse->L);
    reader.bool_param("twosided", &diffuse->twosided);
    reader.string_param("filename", &diffuse->filename);
    reader.float_param("scale", &diffuse->scale);
    reader.float_param("power", &diffuse->power);

    if (reader.failed()) {
      delete diffuse;
      return nullptr;
    }
    return diffuse;
  }


  //
  // Material creation
  //

  // "roughness" sets both directions, the separate params override it.
  static void roughness_params(ParamReader& reader, const char* both, const char* u, const char* v, FloatTex* uroughness, FloatTex* vroughness)
  {
    FloatTex roughness = *uroughness;
    if (reader.float_texture_param(both, &roughness)) {
      *uroughness = roughness;
      *vroughness = roughness;
    }
    reader.float_texture_param(u, uroughness);
    reader.float_texture_param(v, vroughness);
  }


  Material* create_material(const std::string& typeName, const ParamList& params, const TextureLookup& textures, CreateError* err)
  {
    ParamReader reader(params, &textures, err);

    int typeIdx;
    if (typeName.empty() || typeName == "none") {
      typeIdx = int(MaterialType::Interface);
    }
    else {
      typeIdx = find_string_in_array(typeName.c_str(), kMaterialTypes);
    }
    if (typeIdx < 0) {
      reader.fail(ErrorCode::UnknownType, "Unknown material type \"%s\"", typeName.c_str());
      return nullptr;
    }

    Material* material = nullptr;
    switch (static_cast<MaterialType>(typeIdx)) {
    case MaterialType::CoatedConductor:
      {
        CoatedConductorMaterial* coated = new CoatedConductorMaterial();
        roughness_params(reader, "interface.roughness", "interface.uroughness", "interface.vroughness",
                         &coated->interface_uroughness, &coated->interface_vroughness);
        reader.float_texture_param("thickness", &coated->thickness);
        reader.float_texture_param("interface.eta", &coated->interface_eta);
        roughness_params(reader, "conductor.roughness", "conductor.uroughness", "conductor.vroughness",
                         &coated->conductor_uroughness, &coated->conductor_vroughness);
        reader.color_texture_param("conductor.eta", &coated->conductor_eta);
        reader.color_texture_param("conductor.k", &coated->conductor_k);
        coated->hasReflectance = reader.color_texture_param("reflectance", &coated->reflectance);
        reader.float_texture_param("g", &coated->g);
        reader.color_texture_param("albedo", &coated->albedo);
        reader.int_param("maxdepth", &coated->maxdepth);
        reader.int_param("nsamples", &coated->nsamples);
        reader.bool_param("remaproughness", &coated->remaproughness);
        material = coated;
      }
      break;

    case MaterialType::CoatedDiffuse:
      {
        CoatedDiffuseMaterial* coated = new CoatedDiffuseMaterial();
        reader.color_texture_param("reflectance", &coated->reflectance);
        roughness_params(reader, "roughness", "uroughness", "vroughness", &coated->uroughness, &coated->vroughness);
        reader.float_texture_param("thickness", &coated->thickness);
        reader.float_texture_param("eta", &coated->eta);
        reader.float_texture_param("g", &coated->g);
        reader.color_texture_param("albedo", &coated->albedo);
        reader.int_param("maxdepth", &coated->maxdepth);
        reader.int_param("nsamples", &coated->nsamples);
        reader.bool_param("remaproughness", &coated->remaproughness);
        material = coated;
      }
      break;

    case MaterialType::Conductor:
      {
        ConductorMaterial* conductor = new ConductorMaterial();
        reader.color_texture_param("eta", &conductor->eta);
        reader.color_texture_param("k", &conductor->k);
        conductor->hasReflectance = reader.color_texture_param("reflectance", &conductor->reflectance);
        roughness_params(reader, "roughness", "uroughness", "vroughness", &conductor->uroughness, &conductor->vroughness);
        reader.bool_param("remaproughness", &conductor->remaproughness);
        material = conductor;
      }
      break;

    case MaterialType::Dielectric:
      {
        DielectricMaterial* dielectric = new DielectricMaterial();
        reader.float_texture_param("eta", &dielectric->eta);
        roughness_params(reader, "roughness", "uroughness", "vroughness", &dielectric->uroughness, &dielectric->vroughness);
        reader.bool_param("remaproughness", &dielectric->remaproughness);
        material = dielectric;
      }
      break;

    case MaterialType::Diffuse:
      {
        DiffuseMaterial* diffuse = new DiffuseMaterial();
        reader.color_texture_param("reflectance", &diffuse->reflectance);
        material = diffuse;
      }
      break;

    case MaterialType::DiffuseTransmission:
      {
        DiffuseTransmissionMaterial* difftrans = new DiffuseTransmissionMaterial();
        reader.color_texture_param("reflectance", &difftrans->reflectance);
        reader.color_texture_param("transmittance", &difftrans->transmittance);
        reader.float_param("scale", &difftrans->scale);
        material = difftrans;
      }
      break;

    case MaterialType::Hair:
      {
        HairMaterial* hair = new HairMaterial();
        hair->has_sigma_a = reader.color_texture_param("sigma_a", &hair->sigma_a);
        hair->has_color = reader.color_texture_param("color", &hair->color);
        reader.float_texture_param("eumelanin", &hair->eumelanin);
        reader.float_texture_param("pheomelanin", &hair->pheomelanin);
        reader.float_texture_param("eta", &hair->eta);
        reader.float_texture_param("beta_m", &hair->beta_m);
        reader.float_texture_param("beta_n", &hair->beta_n);
        reader.float_texture_param("alpha", &hair->alpha);
        material = hair;
      }
      break;

    case MaterialType::Interface:
      material = new InterfaceMaterial();
      break;

    case MaterialType::Measured:
      {
        MeasuredMaterial* measured = new MeasuredMaterial();
        reader.required_string_param("filename", &measured->filename);
        material = measured;
      }
      break;

    case MaterialType::Mix:
      {
        MixMaterial* mix = new MixMaterial();
        reader.float_texture_param("amount", &mix->amount);
        const Param* materials = params.find("materials");
        if (materials == nullptr || materials->type() != ParamType::String) {
          reader.fail(ErrorCode::MissingParam, "Required parameter \"string materials\" is missing");
        }
        else if (materials->count() != 2) {
          reader.fail(ErrorCode::InvalidParamValue, "Parameter \"materials\" needs 2 names but has %u", materials->count());
        }
        else {
          const std::vector<std::string>& names = *materials->strings();
          uint32_t* dests[2] = { &mix->namedmaterial1, &mix->namedmaterial2 };
          for (uint32_t i = 0; i < 2; i++) {
            auto it = (textures.namedMaterials != nullptr) ? textures.namedMaterials->find(names[i]) : NameToIndex::const_iterator();
            if (textures.namedMaterials == nullptr || it == textures.namedMaterials->end()) {
              reader.fail(ErrorCode::InvalidParamValue, "Mix material refers to an undefined material \"%s\"", names[i].c_str());
              break;
            }
            *dests[i] = it->second;
          }
        }
        material = mix;
      }
      break;

    case MaterialType::Subsurface:
      {
        SubsurfaceMaterial* subsurface = new SubsurfaceMaterial();
        reader.string_param("name", &subsurface->coefficients);
        reader.float_texture_param("eta", &subsurface->eta);
        reader.float_param("g", &subsurface->g);
        subsurface->hasMfp = reader.color_texture_param("mfp", &subsurface->mfp);
        subsurface->hasReflectance = reader.color_texture_param("reflectance", &subsurface->reflectance);
        reader.color_texture_param("sigma_a", &subsurface->sigma_a);
        reader.color_texture_param("sigma_s", &subsurface->sigma_s);
        reader.float_param("scale", &subsurface->scale);
        roughness_params(reader, "roughness", "uroughness", "vroughness", &subsurface->uroughness, &subsurface->vroughness);
        reader.bool_param("remaproughness", &subsurface->remaproughness);
        material = subsurface;
      }
      break;

    case MaterialType::ThinDielectric:
      {
        ThinDielectricMaterial* thin = new ThinDielectricMaterial();
        reader.float_texture_param("eta", &thin->eta);
        material = thin;
      }
      break;
    }

    reader.float_texture_param("displacement", &material->displacement);
    reader.string_param("normalmap", &material->normalmap);

    if (reader.failed()) {
      delete material;
      return nullptr;
    }
    return material;
  }


  //
  // Texture creation
  //

  Texture* create_texture(const std::string& typeName, TextureData dataType, const ParamList& params, const TextureLookup& textures, CreateError* err)
  {
    ParamReader reader(params, &textures, err);
    int typeIdx = find_string_in_array(typeName.c_str(), kTextureTypes);
    if (typeIdx < 0) {
      reader.fail(ErrorCode::UnknownType, "Unknown texture type \"%s\"", typeName.c_str());
      return nullptr;
    }

    Texture* texture = nullptr;
    switch (static_cast<TextureType>(typeIdx)) {
    case TextureType::Bilerp:
      {
        BilerpTexture* bilerp = new BilerpTexture();
        reader.value_texture_param("v00", dataType, &bilerp->v00);
        reader.value_texture_param("v01", dataType, &bilerp->v01);
        reader.value_texture_param("v10", dataType, &bilerp->v10);
        reader.value_texture_param("v11", dataType, &bilerp->v11);
        texture = bilerp;
      }
      break;

    case TextureType::Checkerboard:
      {
        CheckerboardTexture* checkerboard = new CheckerboardTexture();
        if (reader.int_param("dimension", &checkerboard->dimension) && checkerboard->dimension != 2 && checkerboard->dimension != 3) {
          reader.fail(ErrorCode::InvalidParamValue, "%d dimensional checkerboard texture not supported", checkerboard->dimension);
        }
        reader.value_texture_param("tex1", dataType, &checkerboard->tex1);
        reader.value_texture_param("tex2", dataType, &checkerboard->tex2);
        texture = checkerboard;
      }
      break;

    case TextureType::Constant:
      {
        ConstantTexture* constant = new ConstantTexture();
        reader.value_texture_param("value", dataType, &constant->value);
        texture = constant;
      }
      break;

    case TextureType::DirectionMix:
      {
        DirectionMixTexture* dirmix = new DirectionMixTexture();
        reader.value_texture_param("tex1", dataType, &dirmix->tex1);
        reader.value_texture_param("tex2", dataType, &dirmix->tex2);
        reader.float_array_param("dir", 3, dirmix->dir);
        texture = dirmix;
      }
      break;

    case TextureType::Dots:
      {
        DotsTexture* dots = new DotsTexture();
        reader.value_texture_param("inside", dataType, &dots->inside);
        reader.value_texture_param("outside", dataType, &dots->outside);
        texture = dots;
      }
      break;

    case TextureType::FBM:
      {
        FBMTexture* fbm = new FBMTexture();
        reader.int_param("octaves", &fbm->octaves);
        reader.float_param("roughness", &fbm->roughness);
        texture = fbm;
      }
      break;

    case TextureType::ImageMap:
      {
        ImageMapTexture* imagemap = new ImageMapTexture();
        reader.required_string_param("filename", &imagemap->filename);
        reader.typed_enum_param("wrap", kWrapModes, &imagemap->wrap);
        reader.float_param("maxanisotropy", &imagemap->maxanisotropy);
        reader.string_param("filter", &imagemap->filter);
        reader.string_param("encoding", &imagemap->encoding);
        reader.float_param("scale", &imagemap->scale);
        reader.bool_param("invert", &imagemap->invert);
        texture = imagemap;
      }
      break;

    case TextureType::Marble:
      {
        MarbleTexture* marble = new MarbleTexture();
        reader.int_param("octaves", &marble->octaves);
        reader.float_param("roughness", &marble->roughness);
        reader.float_param("scale", &marble->scale);
        reader.float_param("variation", &marble->variation);
        texture = marble;
      }
      break;

    case TextureType::Mix:
      {
        MixTexture* mix = new MixTexture();
        reader.value_texture_param("tex1", dataType, &mix->tex1);
        reader.value_texture_param("tex2", dataType, &mix->tex2);
        reader.float_texture_param("amount", &mix->amount);
        texture = mix;
      }
      break;

    case TextureType::PTex:
      {
        PTexTexture* ptex = new PTexTexture();
        reader.required_string_param("filename", &ptex->filename);
        reader.string_param("encoding", &ptex->encoding);
        reader.float_param("scale", &ptex->scale);
        texture = ptex;
      }
      break;

    case TextureType::Scale:
      {
        ScaleTexture* scale = new ScaleTexture();
        reader.value_texture_param("tex", dataType, &scale->tex);
        reader.float_texture_param("scale", &scale->scale);
        texture = scale;
      }
      break;

    case TextureType::Windy:
      texture = new WindyTexture();
      break;

    case TextureType::Wrinkled:
      {
        WrinkledTexture* wrinkled = new WrinkledTexture();
        reader.int_param("octaves", &wrinkled->octaves);
        reader.float_param("roughness", &wrinkled->roughness);
        texture = wrinkled;
      }
      break;
    }

    Texture2D* tex2d = dynamic_cast<Texture2D*>(texture);
    if (tex2d != nullptr) {
      reader.typed_enum_param("mapping", kTexCoordMappings, &tex2d->mapping);
      reader.float_param("uscale", &tex2d->uscale);
      reader.float_param("vscale", &tex2d->vscale);
      reader.float_param("udelta", &tex2d->udelta);
      reader.float_param("vdelta", &tex2d->vdelta);
      reader.float_array_param("v1", 3, tex2d->v1);
      reader.float_array_param("v2", 3, tex2d->v2);
    }

    texture->dataType = dataType;

    if (reader.failed()) {
      delete texture;
      return nullptr;
    }
    return texture;
  }


  //
  // Medium creation
  //

  Medium* create_medium(const std::string& typeName, const ParamList& params, CreateError* err)
  {
    ParamReader reader(params, nullptr, err);
    int typeIdx = find_string_in_array(typeName.c_str(), kMediumTypes);
    if (typeIdx < 0) {
      reader.fail(ErrorCode::UnknownType, "Unknown medium type \"%s\"", typeName.c_str());
      return nullptr;
    }

    Medium* medium = nullptr;
    switch (static_cast<MediumType>(typeIdx)) {
    case MediumType::Homogeneous:
      {
        HomogeneousMedium* homogeneous = new HomogeneousMedium();
        reader.spectrum_param("Le", &homogeneous->Le);
        reader.float_param("Lescale", &homogeneous->Lescale);
        medium = homogeneous;
      }
      break;

    case MediumType::UniformGrid:
      {
        UniformGridMedium* grid = new UniformGridMedium();
        reader.int_param("nx", &grid->nx);
        reader.int_param("ny", &grid->ny);
        reader.int_param("nz", &grid->nz);
        if (!reader.float_vector_param("density", &grid->density)) {
          reader.fail(ErrorCode::MissingParam, "Required parameter \"float density\" is missing");
        }
        else if (grid->nx <= 0 || grid->ny <= 0 || grid->nz <= 0 ||
                 grid->density.size() != size_t(grid->nx) * size_t(grid->ny) * size_t(grid->nz)) {
          reader.fail(ErrorCode::InvalidParamValue, "Density grid has %u values, expected %d x %d x %d",
                      uint32_t(grid->density.size()), grid->nx, grid->ny, grid->nz);
        }
        reader.float_array_param("p0", 3, grid->p0);
        reader.float_array_param("p1", 3, grid->p1);
        reader.spectrum_param("Le", &grid->Le);
        reader.float_param("Lescale", &grid->Lescale);
        medium = grid;
      }
      break;

    case MediumType::Cloud:
      {
        CloudMedium* cloud = new CloudMedium();
        reader.float_param("density", &cloud->density);
        reader.float_param("wispiness", &cloud->wispiness);
        reader.float_param("frequency", &cloud->frequency);
        reader.float_array_param("p0", 3, cloud->p0);
        reader.float_array_param("p1", 3, cloud->p1);
        medium = cloud;
      }
      break;

    case MediumType::NanoVDB:
      {
        NanoVDBMedium* nanovdb = new NanoVDBMedium();
        reader.required_string_param("filename", &nanovdb->filename);
        reader.float_param("Lescale", &nanovdb->Lescale);
        reader.float_param("temperaturecutoff", &nanovdb->temperaturecutoff);
        reader.float_param("temperaturescale", &nanovdb->temperaturescale);
        medium = nanovdb;
      }
      break;
    }

    reader.spectrum_param("sigma_a", &medium->sigma_a);
    reader.spectrum_param("sigma_s", &medium->sigma_s);
    reader.float_param("scale", &medium->scale);
    reader.float_param("g", &medium->g);
    reader.string_param("preset", &medium->preset);

    if (reader.failed()) {
      delete medium;
      return nullptr;
    }
    return medium;
  }

} // namespace pbrtscene
