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

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <string>


namespace pbrtscene {

  //
  // Constants
  //

  static constexpr float kPi = 3.14159265358979323846f;

  static const char* kAttributeTargets[] = { "shape", "light", "material", "medium", "texture", nullptr };
  static const char* kColorSpaces[] = { "srgb", "aces2065-1", "rec2020", "dci-p3", nullptr };
  static const char* kRenderCoordSystems[] = { "cameraworld", "camera", "world", nullptr };


  //
  // Internal-only functions
  //

  static int file_open(FILE** f, const char* filename, const char* mode)
  {
#ifdef _WIN32
    return fopen_s(f, filename, mode);
#else
    *f = fopen(filename, mode);
    return (*f != nullptr) ? 0 : errno;
#endif
  }


  static bool has_extension(const std::string& path, const char* ext)
  {
    size_t extLen = std::strlen(ext);
    return path.size() >= extLen && path.compare(path.size() - extLen, extLen, ext) == 0;
  }


  static bool is_absolute_path(const std::string& path)
  {
    if (path.empty()) {
      return false;
    }
    if (path[0] == '/' || path[0] == '\\') {
      return true;
    }
    return path.size() > 1 && ((path[0] >= 'a' && path[0] <= 'z') || (path[0] >= 'A' && path[0] <= 'Z')) && path[1] == ':';
  }


  // Everything up to and including the last path separator, or an empty
  // string if there isn't one.
  static std::string directory_of(const char* filename)
  {
    size_t dirLen = 0;
    for (size_t i = 0; filename[i] != '\0'; i++) {
      if (filename[i] == '/' || filename[i] == '\\') {
        dirLen = i + 1;
      }
    }
    return std::string(filename, dirLen);
  }


  static Vec3 vec3(const float* vals)
  {
    Vec3 v = { vals[0], vals[1], vals[2] };
    return v;
  }


  //
  // Public functions
  //

  const char* type_name(ColorSpace colorSpace)
  {
    return name_in_array(kColorSpaces, colorSpace);
  }


  const char* type_name(RenderCoordSys coordSys)
  {
    return name_in_array(kRenderCoordSystems, coordSys);
  }


  //
  // SceneBuilder public methods
  //

  SceneBuilder::SceneBuilder()
  {
    m_scene = new Scene();
  }


  SceneBuilder::~SceneBuilder()
  {
    release_buffers();
    delete m_scene;
    delete m_error;
  }


  void SceneBuilder::set_max_include_depth(uint32_t n)
  {
    m_maxIncludeDepth = n;
  }


  bool SceneBuilder::load_file(const char* filename)
  {
    reset();
    if (filename == nullptr || filename[0] == '\0') {
      return set_error(ErrorCode::IOError, "No filename provided");
    }

    m_rootFilename = filename;
    m_baseDir = directory_of(filename);

    bool ok = push_file(m_rootFilename) && run();
    release_buffers();
    return ok;
  }


  bool SceneBuilder::load_buffer(const char* text, size_t len, const char* baseDir)
  {
    reset();
    m_rootFilename = "<buffer>";
    if (baseDir != nullptr && baseDir[0] != '\0') {
      m_baseDir = baseDir;
      char last = m_baseDir.back();
      if (last != '/' && last != '\\') {
        m_baseDir.push_back('/');
      }
    }

    char* buf = new char[len + 1];
    if (len > 0) {
      std::memcpy(buf, text, len);
    }
    buf[len] = '\0';

    bool ok = push_buffer(buf, len, m_rootFilename) && run();
    release_buffers();
    return ok;
  }


  bool SceneBuilder::apply(const Directive& d)
  {
    if (m_error != nullptr) {
      return false;
    }
    if (m_scene == nullptr) {
      m_scene = new Scene();
    }

    m_directiveOffset = d.offset;

    switch (d.id) {
    case DirectiveID::Identity:
      m_state.ctm.identity();
      return true;

    case DirectiveID::Translate:
      m_state.ctm.translate(vec3(d.floats));
      return true;

    case DirectiveID::Scale:
      m_state.ctm.scale(vec3(d.floats));
      return true;

    case DirectiveID::Rotate:
      m_state.ctm.rotate(d.floats[0] * kPi / 180.0f, vec3(d.floats + 1));
      return true;

    case DirectiveID::LookAt:
      m_state.ctm.lookAt(vec3(d.floats), vec3(d.floats + 3), vec3(d.floats + 6));
      return true;

    case DirectiveID::Transform:
      m_state.ctm.set_column_major(d.floats);
      return true;

    case DirectiveID::ConcatTransform:
      {
        Mat4 m;
        m.set_column_major(d.floats);
        m_state.ctm.concatTransform(m);
      }
      return true;

    case DirectiveID::CoordinateSystem:
      m_namedCoordinateSystems[d.strings[0]] = m_state.ctm;
      return true;

    case DirectiveID::CoordSysTransform:
      {
        auto it = m_namedCoordinateSystems.find(d.strings[0]);
        if (it == m_namedCoordinateSystems.end()) {
          return set_error(ErrorCode::UnknownCoordinateSystem, "Unknown coordinate system \"%s\"", d.strings[0].c_str());
        }
        m_state.ctm = it->second;
      }
      return true;

    case DirectiveID::TransformBegin:
      return push_scope(ScopeKind::Transform);

    case DirectiveID::TransformEnd:
      return pop_scope(ScopeKind::Transform, "TransformEnd");

    case DirectiveID::TransformTimes:
    case DirectiveID::ActiveTransform:
    case DirectiveID::Import:
      return set_error(ErrorCode::Unsupported, "%s is not supported", directive_name(d.id));

    case DirectiveID::AttributeBegin:
      return push_scope(ScopeKind::Attribute);

    case DirectiveID::AttributeEnd:
      return pop_scope(ScopeKind::Attribute, "AttributeEnd");

    case DirectiveID::Attribute:
      return apply_Attribute(d);

    case DirectiveID::WorldBegin:
      if (m_inWorld) {
        return set_error(ErrorCode::MultipleWorldBegin, "WorldBegin has already been seen");
      }
      m_inWorld = true;
      m_state.ctm.identity();
      m_namedCoordinateSystems["world"] = m_state.ctm;
      return true;

    case DirectiveID::ReverseOrientation:
      m_state.reverseOrientation = !m_state.reverseOrientation;
      return true;

    case DirectiveID::ObjectBegin:
      return apply_ObjectBegin(d);

    case DirectiveID::ObjectEnd:
      return apply_ObjectEnd(d);

    case DirectiveID::ObjectInstance:
      return apply_ObjectInstance(d);

    case DirectiveID::Option:
      return apply_Option(d);

    case DirectiveID::ColorSpace:
      return apply_ColorSpace(d);

    case DirectiveID::Camera:
      return apply_Camera(d);

    case DirectiveID::Film:
      {
        CreateError err;
        Film* film = create_film(d.strings[0], d.params, &err);
        if (film == nullptr) {
          return creation_failed("film", d.strings[0], err);
        }
        delete m_scene->film;
        m_scene->film = film;
      }
      return true;

    case DirectiveID::Sampler:
      {
        CreateError err;
        Sampler* sampler = create_sampler(d.strings[0], d.params, &err);
        if (sampler == nullptr) {
          return creation_failed("sampler", d.strings[0], err);
        }
        delete m_scene->sampler;
        m_scene->sampler = sampler;
      }
      return true;

    case DirectiveID::Integrator:
      {
        CreateError err;
        Integrator* integrator = create_integrator(d.strings[0], d.params, &err);
        if (integrator == nullptr) {
          return creation_failed("integrator", d.strings[0], err);
        }
        delete m_scene->integrator;
        m_scene->integrator = integrator;
      }
      return true;

    case DirectiveID::Accelerator:
      {
        CreateError err;
        Accelerator* accel = create_accelerator(d.strings[0], d.params, &err);
        if (accel == nullptr) {
          return creation_failed("accelerator", d.strings[0], err);
        }
        delete m_scene->accelerator;
        m_scene->accelerator = accel;
      }
      return true;

    case DirectiveID::PixelFilter:
      {
        CreateError err;
        Filter* filter = create_filter(d.strings[0], d.params, &err);
        if (filter == nullptr) {
          return creation_failed("pixel filter", d.strings[0], err);
        }
        delete m_scene->filter;
        m_scene->filter = filter;
      }
      return true;

    case DirectiveID::Shape:
      return apply_Shape(d);

    case DirectiveID::Material:
      return apply_Material(d);

    case DirectiveID::MakeNamedMaterial:
      return apply_MakeNamedMaterial(d);

    case DirectiveID::NamedMaterial:
      // An unknown name leaves the shape with no material.
      m_state.material = named_material(d.strings[0].c_str());
      return true;

    case DirectiveID::Texture:
      return apply_Texture(d);

    case DirectiveID::LightSource:
      return apply_LightSource(d);

    case DirectiveID::AreaLightSource:
      return apply_AreaLightSource(d);

    case DirectiveID::MakeNamedMedium:
      return apply_MakeNamedMedium(d);

    case DirectiveID::MediumInterface:
      m_state.insideMedium = d.strings[0];
      m_state.outsideMedium = (d.numStrings > 1) ? d.strings[1] : d.strings[0];
      return true;

    case DirectiveID::Include:
      return apply_Include(d);
    }

    return set_error(ErrorCode::UnknownDirective, "Unhandled directive");
  }


  bool SceneBuilder::finish()
  {
    if (m_error != nullptr) {
      return false;
    }

    m_directiveOffset = m_rootLen;

    if (m_activeObject != kInvalidIndex) {
      return set_error(ErrorCode::UnbalancedAttributes, "Object \"%s\" is missing an ObjectEnd",
                       m_scene->objects[m_activeObject]->name.c_str());
    }
    if (!m_stack.empty()) {
      return set_error(ErrorCode::UnbalancedAttributes, "%u AttributeBegin or TransformBegin scopes were never closed",
                       uint32_t(m_stack.size()));
    }
    if (!m_inWorld) {
      return set_error(ErrorCode::MissingWorldBegin, "The input has no WorldBegin");
    }
    return true;
  }


  const GraphicsState& SceneBuilder::state() const
  {
    return m_state;
  }


  uint32_t SceneBuilder::scope_depth() const
  {
    return uint32_t(m_stack.size());
  }


  const Mat4* SceneBuilder::named_coordinate_system(const char* name) const
  {
    auto it = m_namedCoordinateSystems.find(name);
    return (it != m_namedCoordinateSystems.end()) ? &it->second : nullptr;
  }


  uint32_t SceneBuilder::named_material(const char* name) const
  {
    auto it = m_namedMaterials.find(name);
    return (it != m_namedMaterials.end()) ? it->second : kInvalidIndex;
  }


  uint32_t SceneBuilder::named_medium(const char* name) const
  {
    auto it = m_namedMediums.find(name);
    return (it != m_namedMediums.end()) ? it->second : kInvalidIndex;
  }


  uint32_t SceneBuilder::float_texture(const char* name) const
  {
    auto it = m_floatTextures.find(name);
    return (it != m_floatTextures.end()) ? it->second : kInvalidIndex;
  }


  uint32_t SceneBuilder::spectrum_texture(const char* name) const
  {
    auto it = m_spectrumTextures.find(name);
    return (it != m_spectrumTextures.end()) ? it->second : kInvalidIndex;
  }


  bool SceneBuilder::in_world() const
  {
    return m_inWorld;
  }


  Scene* SceneBuilder::take_scene()
  {
    Scene* scene = m_scene;
    m_scene = nullptr;
    return scene;
  }


  Scene* SceneBuilder::borrow_scene()
  {
    return m_scene;
  }


  bool SceneBuilder::has_error() const
  {
    return m_error != nullptr;
  }


  const Error* SceneBuilder::error() const
  {
    return m_error;
  }


  //
  // SceneBuilder private methods
  //

  bool SceneBuilder::run()
  {
    return drain(0) && finish();
  }


  // Processes directives until the parser stack shrinks back to `stopDepth`
  // frames. An exhausted parser is popped and its includer resumes.
  bool SceneBuilder::drain(size_t stopDepth)
  {
    Directive directive;
    while (m_parsers.size() > stopDepth) {
      DirectiveParser* parser = m_parsers.back();
      if (!parser->next_directive(&directive)) {
        if (parser->has_error()) {
          if (m_error == nullptr) {
            m_error = parser->take_error();
          }
          return false;
        }
        m_parsers.pop_back();
        delete parser;
        continue;
      }
      if (!apply(directive)) {
        return false;
      }
    }
    return true;
  }


  void SceneBuilder::reset()
  {
    release_buffers();

    delete m_scene;
    m_scene = new Scene();
    delete m_error;
    m_error = nullptr;

    m_baseDir.clear();
    m_rootFilename.clear();

    m_state = GraphicsState();
    m_stack.clear();
    m_namedCoordinateSystems.clear();
    m_namedMaterials.clear();
    m_namedMediums.clear();
    m_floatTextures.clear();
    m_spectrumTextures.clear();
    m_objects.clear();

    m_activeObject = kInvalidIndex;
    m_inWorld = false;
    m_directiveOffset = 0;
  }


  void SceneBuilder::release_buffers()
  {
    for (DirectiveParser* parser : m_parsers) {
      delete parser;
    }
    m_parsers.clear();

    for (char* buf : m_buffers) {
      delete[] buf;
    }
    m_buffers.clear();

    m_rootText = nullptr;
    m_rootLen = 0;
  }


  bool SceneBuilder::push_file(const std::string& path)
  {
    FILE* f = nullptr;
    if (file_open(&f, path.c_str(), "rb") != 0 || f == nullptr) {
      return set_error(ErrorCode::IOError, "Failed to open %s", path.c_str());
    }

    long len = -1;
    if (fseek(f, 0, SEEK_END) == 0) {
      len = ftell(f);
    }
    if (len < 0 || fseek(f, 0, SEEK_SET) != 0) {
      fclose(f);
      return set_error(ErrorCode::IOError, "Failed to read %s", path.c_str());
    }

    char* buf = new char[size_t(len) + 1];
    size_t numRead = fread(buf, 1, size_t(len), f);
    fclose(f);
    if (numRead != size_t(len)) {
      delete[] buf;
      return set_error(ErrorCode::IOError, "Failed to read %s", path.c_str());
    }
    buf[len] = '\0';

    return push_buffer(buf, size_t(len), path);
  }


  // Takes ownership of `text`.
  bool SceneBuilder::push_buffer(char* text, size_t len, const std::string& filename)
  {
    m_buffers.push_back(text);
    if (m_parsers.empty() && m_rootText == nullptr) {
      m_rootText = text;
      m_rootLen = len;
    }
    m_parsers.push_back(new DirectiveParser(text, len, filename.c_str()));
    return true;
  }


  bool SceneBuilder::set_error(ErrorCode code, const char* fmt, ...)
  {
    if (m_error != nullptr) {
      return false;
    }

    va_list args;
    va_start(args, fmt);
    char* errorMessage = format_message(fmt, args);
    va_end(args);

    const char* filename = m_rootFilename.c_str();
    const char* text = m_rootText;
    size_t len = m_rootLen;
    if (!m_parsers.empty()) {
      filename = m_parsers.back()->filename();
      text = m_parsers.back()->text();
      len = m_parsers.back()->length();
    }

    m_error = new Error(code, filename, int64_t(m_directiveOffset), errorMessage);
    delete[] errorMessage;

    if (text != nullptr) {
      int64_t errorLine, errorCol;
      find_line_and_column(text, len, m_directiveOffset, &errorLine, &errorCol);
      m_error->set_line_and_column(errorLine, errorCol);
    }
    return false;
  }


  bool SceneBuilder::push_scope(ScopeKind kind)
  {
    PushedState pushed;
    pushed.kind = kind;
    pushed.state = m_state;
    m_stack.push_back(pushed);
    return true;
  }


  bool SceneBuilder::pop_scope(ScopeKind kind, const char* directive)
  {
    if (m_stack.empty()) {
      return set_error(ErrorCode::UnbalancedAttributes, "%s without a matching begin", directive);
    }
    if (m_stack.back().kind != kind) {
      return set_error(ErrorCode::UnbalancedAttributes, "%s doesn't match the innermost open scope", directive);
    }

    // A transform scope only saves the CTM.
    if (kind == ScopeKind::Transform) {
      m_state.ctm = m_stack.back().state.ctm;
    }
    else {
      m_state = m_stack.back().state;
    }
    m_stack.pop_back();
    return true;
  }


  bool SceneBuilder::apply_Option(const Directive& d)
  {
    const Param& option = d.option;
    const std::string& name = option.name();
    Options& options = m_scene->options;

    bool* boolDest = nullptr;
    if (name == "disablepixeljitter") {
      boolDest = &options.disablepixeljitter;
    }
    else if (name == "disabletexturefiltering") {
      boolDest = &options.disabletexturefiltering;
    }
    else if (name == "disablewavelengthjitter") {
      boolDest = &options.disablewavelengthjitter;
    }
    else if (name == "forcediffuse") {
      boolDest = &options.forcediffuse;
    }
    else if (name == "pixelstats") {
      boolDest = &options.pixelstats;
    }
    else if (name == "wavefront") {
      boolDest = &options.wavefront;
    }

    if (boolDest != nullptr) {
      if (option.type() != ParamType::Bool || option.count() != 1) {
        return set_error(ErrorCode::InvalidParamValue, "Option \"%s\" needs a single bool value", name.c_str());
      }
      *boolDest = option.bools()->front();
      return true;
    }

    if (name == "displacementedgescale") {
      if (option.type() != ParamType::Float || option.count() != 1) {
        return set_error(ErrorCode::InvalidParamValue, "Option \"%s\" needs a single float value", name.c_str());
      }
      options.displacementedgescale = option.floats()->front();
      return true;
    }

    if (name == "seed") {
      if (option.type() != ParamType::Int || option.count() != 1) {
        return set_error(ErrorCode::InvalidParamValue, "Option \"%s\" needs a single integer value", name.c_str());
      }
      options.seed = option.ints()->front();
      return true;
    }

    if (name == "msereferenceimage" || name == "msereferenceout" || name == "rendercoordsys") {
      if (option.type() != ParamType::String || option.count() != 1) {
        return set_error(ErrorCode::InvalidParamValue, "Option \"%s\" needs a single string value", name.c_str());
      }
      const std::string& value = option.strings()->front();
      if (name == "msereferenceimage") {
        options.msereferenceimage = value;
      }
      else if (name == "msereferenceout") {
        options.msereferenceout = value;
      }
      else {
        int index = find_string_in_array(value.c_str(), kRenderCoordSystems);
        if (index < 0) {
          return set_error(ErrorCode::UnknownCoordinateSystem, "Unknown render coordinate system \"%s\"", value.c_str());
        }
        options.rendercoordsys = static_cast<RenderCoordSys>(index);
      }
      return true;
    }

    return set_error(ErrorCode::UnknownOption, "Unknown option \"%s\"", name.c_str());
  }


  bool SceneBuilder::apply_ColorSpace(const Directive& d)
  {
    int index = find_string_in_array(d.strings[0].c_str(), kColorSpaces);
    if (index < 0) {
      return set_error(ErrorCode::UnknownType, "Unknown color space \"%s\"", d.strings[0].c_str());
    }
    m_scene->colorSpace = static_cast<ColorSpace>(index);
    return true;
  }


  bool SceneBuilder::apply_Camera(const Directive& d)
  {
    CreateError err;
    Camera* camera = create_camera(d.strings[0], d.params, &err);
    if (camera == nullptr) {
      return creation_failed("camera", d.strings[0], err);
    }

    camera->cameraToWorld = inverse(m_state.ctm);
    camera->medium = find_medium(m_state.outsideMedium);
    m_namedCoordinateSystems["camera"] = camera->cameraToWorld;

    delete m_scene->camera;
    m_scene->camera = camera;
    return true;
  }


  bool SceneBuilder::apply_Shape(const Directive& d)
  {
    ParamList params = d.params;
    params.merge(m_state.shapeAttrs);

    CreateError err;
    Shape* shape = create_shape(d.strings[0], params, texture_lookup(), &err);
    if (shape == nullptr) {
      return creation_failed("shape", d.strings[0], err);
    }

    shape->shapeToWorld = m_state.ctm;
    shape->material = m_state.material;
    shape->areaLight = m_state.areaLight;
    shape->insideMedium = find_medium(m_state.insideMedium);
    shape->outsideMedium = find_medium(m_state.outsideMedium);
    shape->object = m_activeObject;
    shape->reverseOrientation = m_state.reverseOrientation;

    if (m_activeObject != kInvalidIndex) {
      Object* object = m_scene->objects[m_activeObject];
      if (object->firstShape == kInvalidIndex) {
        object->firstShape = uint32_t(m_scene->shapes.size());
      }
      ++object->numShapes;
    }

    m_scene->shapes.push_back(shape);
    return true;
  }


  bool SceneBuilder::apply_Material(const Directive& d)
  {
    ParamList params = d.params;
    params.merge(m_state.materialAttrs);

    CreateError err;
    Material* material = create_material(d.strings[0], params, texture_lookup(), &err);
    if (material == nullptr) {
      return creation_failed("material", d.strings[0], err);
    }

    m_state.material = uint32_t(m_scene->materials.size());
    m_scene->materials.push_back(material);
    return true;
  }


  bool SceneBuilder::apply_MakeNamedMaterial(const Directive& d)
  {
    ParamList params = d.params;
    params.merge(m_state.materialAttrs);

    const char* typeName = params.string_value("type");
    if (typeName == nullptr) {
      return set_error(ErrorCode::MissingParam, "Named material \"%s\" has no \"string type\" parameter", d.strings[0].c_str());
    }

    CreateError err;
    Material* material = create_material(typeName, params, texture_lookup(), &err);
    if (material == nullptr) {
      return creation_failed("material", typeName, err);
    }

    material->name = d.strings[0];
    m_namedMaterials[d.strings[0]] = uint32_t(m_scene->materials.size());
    m_scene->materials.push_back(material);
    return true;
  }


  bool SceneBuilder::apply_Texture(const Directive& d)
  {
    const std::string& name = d.strings[0];
    const std::string& dataTypeName = d.strings[1];
    const std::string& typeName = d.strings[2];

    TextureData dataType;
    if (dataTypeName == "float") {
      dataType = TextureData::Float;
    }
    else if (dataTypeName == "spectrum" || dataTypeName == "color") {
      dataType = TextureData::Spectrum;
    }
    else {
      return set_error(ErrorCode::UnknownType, "Unknown texture data type \"%s\"", dataTypeName.c_str());
    }

    ParamList params = d.params;
    params.merge(m_state.textureAttrs);

    CreateError err;
    Texture* texture = create_texture(typeName, dataType, params, texture_lookup(), &err);
    if (texture == nullptr) {
      return creation_failed("texture", typeName, err);
    }

    texture->name = name;
    texture->textureToWorld = m_state.ctm;

    uint32_t index = uint32_t(m_scene->textures.size());
    if (dataType == TextureData::Float) {
      m_floatTextures[name] = index;
    }
    else {
      m_spectrumTextures[name] = index;
    }
    m_scene->textures.push_back(texture);
    return true;
  }


  bool SceneBuilder::apply_LightSource(const Directive& d)
  {
    ParamList params = d.params;
    params.merge(m_state.lightAttrs);

    CreateError err;
    Light* light = create_light(d.strings[0], params, &err);
    if (light == nullptr) {
      return creation_failed("light", d.strings[0], err);
    }

    light->lightToWorld = m_state.ctm;
    light->medium = find_medium(m_state.outsideMedium);
    m_scene->lights.push_back(light);
    return true;
  }


  bool SceneBuilder::apply_AreaLightSource(const Directive& d)
  {
    ParamList params = d.params;
    params.merge(m_state.lightAttrs);

    CreateError err;
    AreaLight* areaLight = create_area_light(d.strings[0], params, &err);
    if (areaLight == nullptr) {
      return creation_failed("area light", d.strings[0], err);
    }

    m_state.areaLight = uint32_t(m_scene->areaLights.size());
    m_scene->areaLights.push_back(areaLight);
    return true;
  }


  bool SceneBuilder::apply_MakeNamedMedium(const Directive& d)
  {
    ParamList params = d.params;
    params.merge(m_state.mediumAttrs);

    const char* typeName = params.string_value("type");
    if (typeName == nullptr) {
      return set_error(ErrorCode::MissingParam, "Named medium \"%s\" has no \"string type\" parameter", d.strings[0].c_str());
    }

    CreateError err;
    Medium* medium = create_medium(typeName, params, &err);
    if (medium == nullptr) {
      return creation_failed("medium", typeName, err);
    }

    medium->mediumName = d.strings[0];
    medium->mediumToWorld = m_state.ctm;
    m_namedMediums[d.strings[0]] = uint32_t(m_scene->mediums.size());
    m_scene->mediums.push_back(medium);
    return true;
  }


  bool SceneBuilder::apply_Attribute(const Directive& d)
  {
    ParamList* targets[] = {
      &m_state.shapeAttrs,
      &m_state.lightAttrs,
      &m_state.materialAttrs,
      &m_state.mediumAttrs,
      &m_state.textureAttrs,
    };

    int index = find_string_in_array(d.strings[0].c_str(), kAttributeTargets);
    if (index < 0) {
      return set_error(ErrorCode::InvalidAttributeTarget, "Invalid Attribute target \"%s\"", d.strings[0].c_str());
    }
    targets[index]->merge(d.params);
    return true;
  }


  bool SceneBuilder::apply_ObjectBegin(const Directive& d)
  {
    if (m_activeObject != kInvalidIndex) {
      return set_error(ErrorCode::NestedObject, "ObjectBegin \"%s\" inside the definition of \"%s\"",
                       d.strings[0].c_str(), m_scene->objects[m_activeObject]->name.c_str());
    }

    push_scope(ScopeKind::Object);

    Object* object = new Object();
    object->name = d.strings[0];
    object->objectToInstance = m_state.ctm;

    m_activeObject = uint32_t(m_scene->objects.size());
    m_objects[d.strings[0]] = m_activeObject;
    m_scene->objects.push_back(object);
    return true;
  }


  bool SceneBuilder::apply_ObjectEnd(const Directive& /*d*/)
  {
    if (m_activeObject == kInvalidIndex) {
      return set_error(ErrorCode::UnbalancedAttributes, "ObjectEnd without a matching ObjectBegin");
    }
    if (!pop_scope(ScopeKind::Object, "ObjectEnd")) {
      return false;
    }
    m_activeObject = kInvalidIndex;
    return true;
  }


  bool SceneBuilder::apply_ObjectInstance(const Directive& d)
  {
    if (m_activeObject != kInvalidIndex) {
      return set_error(ErrorCode::NestedObject, "ObjectInstance \"%s\" inside the definition of \"%s\"",
                       d.strings[0].c_str(), m_scene->objects[m_activeObject]->name.c_str());
    }

    auto it = m_objects.find(d.strings[0]);
    if (it == m_objects.end()) {
      return set_error(ErrorCode::UnknownObject, "Unknown object \"%s\"", d.strings[0].c_str());
    }

    Instance* instance = new Instance();
    instance->instanceToWorld = m_state.ctm;
    instance->object = it->second;
    instance->areaLight = m_state.areaLight;
    instance->insideMedium = find_medium(m_state.insideMedium);
    instance->outsideMedium = find_medium(m_state.outsideMedium);
    instance->reverseOrientation = m_state.reverseOrientation;
    m_scene->instances.push_back(instance);
    return true;
  }


  bool SceneBuilder::apply_Include(const Directive& d)
  {
    const std::string& filename = d.strings[0];
    if (has_extension(filename, ".gz")) {
      return set_error(ErrorCode::Unsupported, "Compressed include files are not supported: %s", filename.c_str());
    }
    if (m_parsers.size() > m_maxIncludeDepth) {
      return set_error(ErrorCode::IncludeDepth, "Exceeded the maximum include depth of %u", m_maxIncludeDepth);
    }

    std::string path = is_absolute_path(filename) ? filename : (m_baseDir + filename);

    // Directives applied directly, outside of a load, have no parser to
    // resume so the included file is processed right away.
    size_t depth = m_parsers.size();
    if (!push_file(path)) {
      return false;
    }
    return depth > 0 || drain(depth);
  }


  bool SceneBuilder::creation_failed(const char* what, const std::string& typeName, const CreateError& err)
  {
    if (err.code == ErrorCode::UnknownType) {
      return set_error(err.code, "%s", err.message.c_str());
    }
    return set_error(err.code, "Invalid %s \"%s\": %s", what, typeName.c_str(), err.message.c_str());
  }


  TextureLookup SceneBuilder::texture_lookup() const
  {
    TextureLookup lookup;
    lookup.floatTextures = &m_floatTextures;
    lookup.spectrumTextures = &m_spectrumTextures;
    lookup.namedMaterials = &m_namedMaterials;
    return lookup;
  }


  uint32_t SceneBuilder::find_medium(const std::string& name) const
  {
    if (name.empty()) {
      return kInvalidIndex;
    }
    auto it = m_namedMediums.find(name);
    return (it != m_namedMediums.end()) ? it->second : kInvalidIndex;
  }


  //
  // Loader public methods
  //

  Loader::Loader() :
    m_scene(nullptr),
    m_builder(new SceneBuilder())
  {
  }


  Loader::~Loader()
  {
    delete m_scene;
    delete m_builder;
  }


  void Loader::set_max_include_depth(uint32_t n)
  {
    m_builder->set_max_include_depth(n);
  }


  bool Loader::load(const char* filename)
  {
    delete m_scene;
    m_scene = nullptr;
    if (!m_builder->load_file(filename)) {
      return false;
    }
    m_scene = m_builder->take_scene();
    return true;
  }


  bool Loader::load_from_buffer(const char* text, size_t len, const char* baseDir)
  {
    delete m_scene;
    m_scene = nullptr;
    if (!m_builder->load_buffer(text, len, baseDir)) {
      return false;
    }
    m_scene = m_builder->take_scene();
    return true;
  }


  Scene* Loader::take_scene()
  {
    Scene* scene = m_scene;
    m_scene = nullptr;
    return scene;
  }


  Scene* Loader::borrow_scene()
  {
    return m_scene;
  }


  const Error* Loader::error() const
  {
    return m_builder->error();
  }

} // namespace pbrtscene
