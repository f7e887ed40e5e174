#include "fin_json.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <limits>

namespace {

  fin_variant nlohmann_to_fin(const nlohmann::json& j_val) {
    if (j_val.is_null()) {
      return fin_variant();
    }
    if (j_val.is_boolean()) {
      return fin_variant(j_val.get<bool>());
    }
    if (j_val.is_number_unsigned()) {
      unsigned long long u_val = j_val.get<unsigned long long>();
      if (u_val > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        return fin_variant(static_cast<double>(u_val));
      }
      return fin_variant(static_cast<long long>(u_val));
    }
    if (j_val.is_number_integer()) {
      return fin_variant(j_val.get<long long>());
    }
    if (j_val.is_number_float()) {
      return fin_variant(j_val.get<double>());
    }
    if (j_val.is_string()) {
      return fin_variant(fin_string(j_val.get<std::string>()));
    }
    if (j_val.is_array()) {
      finv_vector vec;
      vec.reserve(j_val.size());
      for (const auto& el : j_val) {
        vec.push_back(nlohmann_to_fin(el));
      }
      return fin_variant(vec);
    }
    if (j_val.is_object()) {
      finv_map map_val;
      for (auto it = j_val.begin(); it != j_val.end(); ++it) {
        map_val[fin_string(it.key())] = nlohmann_to_fin(it.value());
      }
      return fin_variant(map_val);
    }
    return fin_variant();
  }

  nlohmann::json fin_to_nlohmann(const fin_variant& var) {
    switch (var.in_state()) {
      case fin_variant::string_state:
        return var.string_value().to_std_const();
      case fin_variant::int_state:
        return var.int_value();
      case fin_variant::bool_state:
        return var.bool_value();
      case fin_variant::double_state:
        return var.double_value();
      case fin_variant::vector_state: {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& el : var.vector_value()) {
          arr.push_back(fin_to_nlohmann(el));
        }
        return arr;
      }
      case fin_variant::map_state: {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& pair : var.map_value()) {
          obj[pair.first.to_std_const()] = fin_to_nlohmann(pair.second);
        }
        return obj;
      }
      case fin_variant::none:
        break;
    }
    return nullptr;
  }

} // namespace

fin_json::fin_json(finv_map* map_ptr) : data_map(map_ptr) {
  if (!data_map) {
    throw std::invalid_argument("fin_json needs a target map");
  }
}

bool fin_json::parse(const fin_string& json_string) {
  data_map->clear();
  last_error = "";

  try {
    nlohmann::json parsed = nlohmann::json::parse(json_string.to_std_const());
    if (!parsed.is_object()) {
      last_error = "JSON document is not an object";
      return false;
    }
    for (auto it = parsed.begin(); it != parsed.end(); ++it) {
      (*data_map)[fin_string(it.key())] = nlohmann_to_fin(it.value());
    }
    return true;
  } catch (const nlohmann::json::parse_error& e) {
    last_error = fin_string("JSON parse error: ") + e.what();
    return false;
  }
}

fin_string fin_json::create() const {
  nlohmann::json j_obj = nlohmann::json::object();
  for (const auto& pair : *data_map) {
    j_obj[pair.first.to_std_const()] = fin_to_nlohmann(pair.second);
  }

  try {
    // Invalid UTF-8 is replaced instead of aborting the dump
    return fin_string(j_obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
  } catch (const nlohmann::json::type_error& e) {
    std::cerr << "[JSON] Dump failed: " << e.what() << std::endl;
    return fin_string("");
  }
}
