#ifndef fin_ENV_H
#define fin_ENV_H

#include "fin_string.h"

// Load KEY=VALUE lines into the process environment. Variables that are
// already set keep their value.
void load_env_file(const fin_string& filepath);

fin_string env_string(const fin_string& name, const fin_string& def = fin_string());
long long env_int(const fin_string& name, long long def);
double env_double(const fin_string& name, double def);
bool env_bool(const fin_string& name, bool def);

#endif // fin_ENV_H
