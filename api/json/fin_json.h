#ifndef FIN_JSON_H
#define FIN_JSON_H

#include "../../utils/fin_variant.h"

// JSON text <-> variant map. The map is not owned.
class fin_json {
public:
  explicit fin_json(finv_map* map_ptr);

  // Clears the map first. Only a JSON object at the top level is accepted.
  bool parse(const fin_string& json_string);

  // Empty string on failure
  fin_string create() const;

  fin_string get_last_error() const { return last_error; }

private:
  finv_map* data_map;
  fin_string last_error;
};

#endif // FIN_JSON_H
