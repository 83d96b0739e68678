#include "olr/shapefile.hpp"

#include <shapefil.h>

#include <algorithm>
#include <array>
#include <boost/log/trivial.hpp>
#include <climits>
#include <cmath>
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace olr {

// The SHPObjectPtr type is a unique_ptr for SHPObject with a custom
// deleter that calls SHPDestroyObject.
using SHPObjectPtr = std::unique_ptr<SHPObject, decltype(&SHPDestroyObject)>;

// Creates a new shapefile with the specified arguments.
//
// This function is a wrapper around the SHPCreateLL function from the
// shapelib library. When the shapefile is created, the function checks if the
// handle is null and throws a runtime error if it is.
template <typename... Args>
auto shp_create(Args... args) {
  SAHooks sHooks;
  SASetupDefaultHooks(&sHooks);
  sHooks.Error = [](const char * /*message*/) {};
  auto handle = SHPCreateLL(args..., &sHooks);
  if (handle == nullptr) {
    throw std::runtime_error("Failed to create shapefile");
  }
  SHPClose(handle);
}

// Opens an existing shapefile with the specified arguments.
//
// The result is returned as a unique_ptr with a custom deleter that calls
// SHPClose; it holds a null pointer if the file cannot be opened.
template <typename... Args>
auto shp_open(Args... args) {
  SAHooks sHooks;
  SASetupDefaultHooks(&sHooks);
  sHooks.Error = [](const char * /*message*/) {};
  return std::unique_ptr<SHPInfo, decltype(&SHPClose)>(
      SHPOpenLL(args..., &sHooks), SHPClose);
}

// Creates a new dbf file with the specified arguments.
template <typename... Args>
auto dbf_create(Args... args) {
  auto handle = DBFCreate(args...);
  if (handle == nullptr) {
    throw std::runtime_error("Failed to create dbf file");
  }
  DBFClose(handle);
}

// Opens an existing dbf file with the specified arguments.
//
// The result is returned as a unique_ptr with a custom deleter that calls
// DBFClose; it holds a null pointer if the file cannot be opened.
template <typename... Args>
auto dbf_open(Args... args) {
  SAHooks sHooks;
  SASetupDefaultHooks(&sHooks);
  sHooks.Error = [](const char * /*message*/) {};
  return std::unique_ptr<DBFInfo, decltype(&DBFClose)>(
      DBFOpenLL(args..., &sHooks), DBFClose);
}

// Creates a new shapefile object, throwing a runtime error on failure.
template <typename... Args>
auto shp_create_object(Args... args) {
  auto handle = SHPCreateObject(args...);
  if (handle == nullptr) {
    throw std::runtime_error("Failed to create shapefile object");
  }
  return SHPObjectPtr(handle, SHPDestroyObject);
}

// Reads a shapefile object, throwing a runtime error on failure.
template <typename... Args>
auto shp_read_object(Args... args) {
  auto handle = SHPReadObject(args...);
  if (handle == nullptr) {
    throw std::runtime_error("Failed to read shapefile object");
  }
  return SHPObjectPtr(handle, SHPDestroyObject);
}

// Checks if the shape type stores polygons.
inline auto is_polygon_type(int shape_type) -> bool {
  return shape_type == SHPT_POLYGON || shape_type == SHPT_POLYGONZ ||
         shape_type == SHPT_POLYGONM;
}

// Extracts the rings of the shape and assembles the polygons.
//
// @param[in] shape The shape to read.
// @return The multi-polygon constructed from the shape.
auto read_geometry(SHPObjectPtr &shape) -> MultiPolygon {
  const auto *x = shape->padfX;
  const auto *y = shape->padfY;

  auto outers = std::vector<Ring>();
  auto holes = std::vector<Ring>();

  // shapelib is a C library, so we need to use a raw pointer arithmetic here
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  for (int lx = 0; lx < shape->nParts; ++lx) {
    int end = (lx == shape->nParts - 1) ? shape->nVertices
                                        : shape->panPartStart[lx + 1];
    auto ring = Ring();
    ring.reserve(end - shape->panPartStart[lx]);
    for (int jx = shape->panPartStart[lx]; jx < end; ++jx) {
      boost::geometry::append(ring, Point(*x++, *y++));
    }
    // The ring model is clockwise: outer rings have a positive area.
    if (bg::area(ring) >= 0) {
      outers.emplace_back(std::move(ring));
    } else {
      holes.emplace_back(std::move(ring));
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  // Some writers ignore the orientation rule.
  if (outers.empty()) {
    std::swap(outers, holes);
  }

  auto result = MultiPolygon();
  result.reserve(outers.size());
  for (auto &ring : outers) {
    auto polygon = Polygon();
    polygon.outer() = std::move(ring);
    result.emplace_back(std::move(polygon));
  }
  for (auto &ring : holes) {
    auto owner = std::find_if(
        result.begin(), result.end(), [&ring](const Polygon &polygon) {
          return !ring.empty() && bg::within(ring.front(), polygon.outer());
        });
    if (owner != result.end()) {
      owner->inners().emplace_back(std::move(ring));
    } else {
      auto polygon = Polygon();
      polygon.outer() = std::move(ring);
      result.emplace_back(std::move(polygon));
    }
  }
  bg::correct(result);
  return result;
}

// Maps a DBF field type onto the attribute model.
inline auto to_field_type(DBFFieldType type) -> FieldType {
  switch (type) {
    case FTInteger:
      return FieldType::integer;
    case FTDouble:
      return FieldType::real;
    case FTLogical:
      return FieldType::logical;
    case FTDate:
      return FieldType::date;
    default:
      return FieldType::string;
  }
}

// Reads the schema of the attribute table.
auto read_schema(DBFHandle handle) -> Schema {
  auto result = Schema();
  auto count = DBFGetFieldCount(handle);
  for (int ix = 0; ix < count; ++ix) {
    std::array<char, 16> name{};
    int width = 0;
    int decimals = 0;
    auto type = DBFGetFieldInfo(handle, ix, name.data(), &width, &decimals);
    if (type == FTInvalid) {
      throw std::runtime_error("invalid field #" + std::to_string(ix));
    }
    result.push_back(Field{name.data(), to_field_type(type), width, decimals});
  }
  return result;
}

// Reads the attributes of a record.
auto read_attributes(DBFHandle handle, int record, const Schema &schema)
    -> Attributes {
  auto result = Attributes();
  for (size_t ix = 0; ix < schema.size(); ++ix) {
    const auto &field = schema[ix];
    auto column = static_cast<int>(ix);
    if (DBFIsAttributeNULL(handle, record, column) != 0) {
      result.set(field.name, AttributeValue());
      continue;
    }
    switch (field.type) {
      case FieldType::integer:
        // DBFReadIntegerAttribute overflows on wide numeric fields.
        if (field.width > 9) {
          result.set(field.name,
                     static_cast<std::int64_t>(
                         DBFReadDoubleAttribute(handle, record, column)));
        } else {
          result.set(field.name,
                     static_cast<std::int64_t>(
                         DBFReadIntegerAttribute(handle, record, column)));
        }
        break;
      case FieldType::real:
        result.set(field.name, DBFReadDoubleAttribute(handle, record, column));
        break;
      default:
        result.set(field.name,
                   std::string(DBFReadStringAttribute(handle, record, column)));
        break;
    }
  }
  return result;
}

auto load_layer(const std::string &filename, const std::string &name)
    -> Layer {
  auto handle = shp_open(filename.c_str(), "rb");
  if (handle == nullptr) {
    throw std::runtime_error("Failed to open shapefile: '" + filename + "'");
  }
  auto dbf_handle = dbf_open(filename.c_str(), "rb");
  if (dbf_handle == nullptr) {
    throw std::runtime_error("Failed to open dbf file: '" + filename + "'");
  }

  int shape_type = 0;
  int entities = 0;
  std::array<double, 4> min_bound{};
  std::array<double, 4> max_bound{};
  SHPGetInfo(handle.get(), &entities, &shape_type, min_bound.data(),
             max_bound.data());
  if (!is_polygon_type(shape_type)) {
    throw std::runtime_error("'" + filename + "' is not a polygon layer");
  }
  if (DBFGetRecordCount(dbf_handle.get()) != entities) {
    throw std::runtime_error("'" + filename +
                             "': shape and record counts differ");
  }

  auto layer = Layer();
  layer.name =
      name.empty() ? std::filesystem::path(filename).stem().string() : name;
  layer.schema = read_schema(dbf_handle.get());
  layer.features.reserve(entities);

  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  for (int ix = 0; ix < entities; ++ix) {
    auto shape = shp_read_object(handle.get(), ix);
    if (shape->nParts > 0 && shape->panPartStart[0] != 0) {
      throw std::runtime_error("unable to read shape " + std::to_string(ix));
    }
    auto feature = Feature();
    feature.id = std::to_string(ix);
    if (is_polygon_type(shape->nSHPType) && shape->nVertices != 0) {
      feature.geometry = read_geometry(shape);
    }
    feature.attributes = read_attributes(dbf_handle.get(), ix, layer.schema);
    layer.features.emplace_back(std::move(feature));
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  BOOST_LOG_TRIVIAL(info) << "Loaded " << layer.features.size()
                          << " features from '" << filename << "' as layer '"
                          << layer.name << "'";
  return layer;
}

// Writes the geometry of a feature as a polygon shape.
//
// @return The index of the written shape.
auto write_geometry(SHPHandle handle, const MultiPolygon &geometry) -> int {
  auto x = std::vector<double>();
  auto y = std::vector<double>();
  auto pan_starts = std::vector<int>();
  auto pan_types = std::vector<int>();

  auto append_ring = [&](const Ring &ring, int type) {
    pan_starts.push_back(static_cast<int>(x.size()));
    pan_types.push_back(type);
    for (const auto &point : ring) {
      x.push_back(point.get<0>());
      y.push_back(point.get<1>());
    }
  };

  for (const auto &polygon : geometry) {
    append_ring(polygon.outer(), SHPP_OUTERRING);
    for (const auto &inner : polygon.inners()) {
      append_ring(inner, SHPP_INNERRING);
    }
  }

  auto obj = shp_create_object(
      SHPT_POLYGON, -1, static_cast<int>(pan_starts.size()),
      pan_starts.empty() ? nullptr : pan_starts.data(),
      pan_types.empty() ? nullptr : pan_types.data(),
      static_cast<int>(x.size()), x.empty() ? nullptr : x.data(),
      y.empty() ? nullptr : y.data(), nullptr, nullptr);
  auto shape_id = SHPWriteObject(handle, -1, obj.get());
  if (shape_id == -1) {
    throw std::runtime_error("Failed to write shapefile object");
  }
  return shape_id;
}

// Declares a field in the attribute table.
auto add_field(DBFHandle handle, const Field &field) -> void {
  // DBF field names are limited to 10 characters.
  auto name = field.name.substr(0, 10);
  auto type = FTString;
  auto width = std::clamp(field.width, 1, 254);
  auto decimals = 0;
  switch (field.type) {
    case FieldType::integer:
      type = FTInteger;
      width = std::clamp(field.width, 1, 18);
      break;
    case FieldType::real:
      type = FTDouble;
      width = std::clamp(field.width, 3, 24);
      decimals = std::clamp(field.decimals, 0, width - 2);
      break;
    case FieldType::logical:
      type = FTLogical;
      width = 1;
      break;
    case FieldType::date:
      type = FTDate;
      width = 8;
      break;
    case FieldType::string:
      break;
  }
  if (DBFAddField(handle, name.c_str(), type, width, decimals) == -1) {
    throw std::runtime_error("Failed to add field '" + field.name + "'");
  }
}

// Writes one attribute value, converted to the type of its field.
auto write_value(DBFHandle handle, int record, int column, const Field &field,
                 const AttributeValue &value) -> bool {
  if (is_null(value)) {
    return DBFWriteNULLAttribute(handle, record, column) != 0;
  }
  const auto *integer = std::get_if<std::int64_t>(&value);
  const auto *real = std::get_if<double>(&value);
  switch (field.type) {
    case FieldType::integer:
      if (integer != nullptr && *integer >= INT_MIN && *integer <= INT_MAX) {
        return DBFWriteIntegerAttribute(handle, record, column,
                                        static_cast<int>(*integer)) != 0;
      }
      [[fallthrough]];
    case FieldType::real:
      if (integer != nullptr) {
        return DBFWriteDoubleAttribute(handle, record, column,
                                       static_cast<double>(*integer)) != 0;
      }
      if (real != nullptr) {
        return DBFWriteDoubleAttribute(handle, record, column, *real) != 0;
      }
      return DBFWriteNULLAttribute(handle, record, column) != 0;
    case FieldType::logical: {
      auto text = to_string(value);
      auto flag = text.empty() ? '?' : text.front();
      if (integer != nullptr || real != nullptr) {
        flag = text == "0" ? 'F' : 'T';
      }
      return DBFWriteLogicalAttribute(handle, record, column, flag) != 0;
    }
    default:
      return DBFWriteStringAttribute(handle, record, column,
                                     to_string(value).c_str()) != 0;
  }
}

// Creates the .shp and .dbf files and opens them for writing.
auto create_files(const std::string &filename) {
  shp_create(filename.c_str(), SHPT_POLYGON);
  dbf_create(filename.c_str());
  auto handle = shp_open(filename.c_str(), "rb+");
  if (handle == nullptr) {
    throw std::runtime_error("Failed to open shapefile: '" + filename + "'");
  }
  auto dbf_handle = dbf_open(filename.c_str(), "rb+");
  if (dbf_handle == nullptr) {
    throw std::runtime_error("Failed to open dbf file: '" + filename + "'");
  }
  return std::make_pair(std::move(handle), std::move(dbf_handle));
}

auto save_features(const std::string &filename,
                   const ResolvedFeatureSet &features) -> void {
  auto [handle, dbf_handle] = create_files(filename);

  for (const auto &field : features.schema) {
    add_field(dbf_handle.get(), field);
  }

  for (const auto &feature : features.features) {
    auto shape_id = write_geometry(handle.get(), feature.geometry);
    for (size_t ix = 0; ix < features.schema.size(); ++ix) {
      if (!write_value(dbf_handle.get(), shape_id, static_cast<int>(ix),
                       features.schema[ix], feature.values[ix])) {
        throw std::runtime_error("Failed to write attribute '" +
                                 features.schema[ix].name + "' of feature " +
                                 feature.key.str());
      }
    }
  }
  BOOST_LOG_TRIVIAL(info) << "Saved " << features.features.size()
                          << " features to '" << filename << "'";
}

auto save_overlaps(const std::string &filename,
                   const std::vector<OverlapRegion> &overlaps) -> void {
  auto [handle, dbf_handle] = create_files(filename);

  const auto schema = Schema{{"group", FieldType::integer, 10, 0},
                             {"first", FieldType::string, 254, 0},
                             {"second", FieldType::string, 254, 0}};
  for (const auto &field : schema) {
    add_field(dbf_handle.get(), field);
  }

  for (const auto &item : overlaps) {
    auto shape_id = write_geometry(handle.get(), item.region);
    auto values = std::array<AttributeValue, 3>{
        static_cast<std::int64_t>(item.group), item.first.str(),
        item.second.str()};
    for (size_t ix = 0; ix < values.size(); ++ix) {
      if (!write_value(dbf_handle.get(), shape_id, static_cast<int>(ix),
                       schema[ix], values[ix])) {
        throw std::runtime_error("Failed to write overlap attributes");
      }
    }
  }
  BOOST_LOG_TRIVIAL(info) << "Saved " << overlaps.size()
                          << " overlap regions to '" << filename << "'";
}

}  // namespace olr
