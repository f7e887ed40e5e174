#ifndef fin_HASH_H
#define fin_HASH_H

#include "fin_string.h"
#include <vector>

// SHA-256 of data as lowercase hex
fin_string sha256_hex(const fin_string& data);

// SHA-256 of a file's bytes; false if the file cannot be read
bool sha256_file(const fin_string& path, fin_string& hex_out);

fin_string base64_encode(const std::vector<unsigned char>& bytes);

#endif // fin_HASH_H
