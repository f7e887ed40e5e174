#ifndef fin_CHUNK_TAGS_H
#define fin_CHUNK_TAGS_H

#include "fin_chunk.h"
#include <vector>

// Uppercase acronyms such as GDP, CPI or EBITDA, distinct and in order of
// appearance. Currency codes go to the units instead.
std::vector<fin_string> find_entities(const fin_string& text, size_t max_count = 10);

// A single reporting period ("Q3 2024", "H1 2024", "FY2023") when exactly
// one is named, else the span of years mentioned ("2023", "2021-2023").
// Empty without any year.
fin_string find_time_range(const fin_string& text);

// Currency and scale ("EUR billion", "USD", "million"), falling back to
// "%" or "bp" for rates. Empty when nothing matches.
fin_string find_units(const fin_string& text);

// Sets entities, time_range and units of chunk from text
void tag_chunk(fin_chunk& chunk, const fin_string& text);

#endif // fin_CHUNK_TAGS_H
