#include "split_reader/conf_loader.hpp"
#include "split_reader/job_conf.hpp"
#include "split_reader/partition_table.hpp"

#include <simdjson.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace sr {

static bool set_err(std::string* err, std::string msg) {
  if (err) *err = std::move(msg);
  return false;
}

// Strings are stored as-is; objects and arrays (e.g. an inline schema) are
// stored as their raw JSON text.
static bool read_properties(simdjson::ondemand::object obj, Properties* out,
                            std::string_view where, std::string* err) {
  for (auto field : obj) {
    std::string key(std::string_view(field.unescaped_key()));
    simdjson::ondemand::value v = field.value();
    std::string val;
    switch (v.type()) {
      case simdjson::ondemand::json_type::string:
        val = std::string(std::string_view(v.get_string()));
        break;
      case simdjson::ondemand::json_type::object:
      case simdjson::ondemand::json_type::array:
        val = std::string(std::string_view(v.raw_json()));
        break;
      default:
        return set_err(err, std::string(where) + ": value of '" + key + "' must be a string");
    }
    if (out) out->set(std::move(key), std::move(val));
  }
  return true;
}

static bool read_partition(simdjson::ondemand::object obj, std::size_t idx,
                           PartitionTable* parts, std::string* err) {
  const std::string where = "partitions[" + std::to_string(idx) + "]";
  std::string path;
  bool has_path = false;
  Properties props;
  for (auto field : obj) {
    std::string_view key = field.unescaped_key();
    if (key == "path") {
      std::string_view p;
      if (field.value().get_string().get(p)) return set_err(err, where + ": 'path' must be a string");
      path.assign(p.data(), p.size());
      has_path = true;
    } else if (key == "properties") {
      simdjson::ondemand::object pobj;
      if (field.value().get_object().get(pobj)) return set_err(err, where + ": 'properties' must be an object");
      if (!read_properties(pobj, &props, where, err)) return false;
    } else {
      std::cerr << "[conf] " << where << ": ignoring unknown member '" << key << "'\n";
    }
  }
  if (!has_path || path.empty()) return set_err(err, where + ": missing 'path'");
  if (parts) parts->add(std::move(path), std::move(props));
  return true;
}

bool load_job_json(std::string_view json, JobConf* conf, PartitionTable* parts,
                   std::string* err) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);

  try {
    auto doc = parser.iterate(padded);
    simdjson::ondemand::object root;
    if (doc.get_object().get(root)) return set_err(err, "job description must be a JSON object");

    for (auto field : root) {
      std::string_view key = field.unescaped_key();
      if (key == "properties") {
        simdjson::ondemand::object obj;
        if (field.value().get_object().get(obj)) return set_err(err, "'properties' must be an object");
        if (!read_properties(obj, conf, "properties", err)) return false;
      } else if (key == "partitions") {
        simdjson::ondemand::array arr;
        if (field.value().get_array().get(arr)) return set_err(err, "'partitions' must be an array");
        std::size_t idx = 0;
        for (auto elem : arr) {
          simdjson::ondemand::object pobj;
          if (elem.get_object().get(pobj)) {
            return set_err(err, "partitions[" + std::to_string(idx) + "] must be an object");
          }
          if (!read_partition(pobj, idx, parts, err)) return false;
          ++idx;
        }
      } else {
        std::cerr << "[conf] ignoring unknown member '" << key << "'\n";
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    return set_err(err, std::string("malformed job description: ") + e.what());
  }
  return true;
}

bool load_job_file(const std::string& path, JobConf* conf, PartitionTable* parts,
                   std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return set_err(err, "cannot open job file " + path);
  std::ostringstream ss; ss << in.rdbuf();
  std::string body = ss.str();
  std::string inner;
  if (!load_job_json(body, conf, parts, &inner)) {
    return set_err(err, path + ": " + inner);
  }
  std::cerr << "[conf] loaded " << path << ": "
            << (conf ? conf->size() : 0) << " properties, "
            << (parts ? parts->size() : 0) << " partitions\n";
  return true;
}

}
