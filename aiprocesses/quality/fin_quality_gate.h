#ifndef fin_QUALITY_GATE_H
#define fin_QUALITY_GATE_H

#include "../chunks/fin_chunk.h"

struct fin_quality_verdict {
  bool accepted;
  fin_string reason;
};

// Stateless accept/reject checks applied to chunks before they are stored
class fin_quality_gate
{
public:
  fin_quality_gate(long long min_length = 30, long long max_length = 8000, long long table_min_rows = 2,
                   bool verbose = false);

  fin_quality_verdict validate_text(const fin_chunk& chunk) const;
  fin_quality_verdict validate_table(const fin_chunk& chunk) const;
  fin_quality_verdict validate_figure(const fin_chunk& chunk) const;

  // Dispatch on the chunk kind; unknown kinds pass
  fin_quality_verdict validate(const fin_chunk& chunk) const;

  // Partition chunks, preserving their order within each list
  void filter(const fin_model_list<fin_chunk>& chunks, fin_model_list<fin_chunk>& accepted,
              fin_model_list<fin_chunk>& rejected) const;

  // Five or more words with fewer than threshold of them distinct, or
  // fewer than five words at all
  static bool is_repetitive(const fin_string& text, double threshold = 0.5);

private:
  long long min_length;
  long long max_length;
  long long table_min_rows;
  bool verbose;
};

#endif // fin_QUALITY_GATE_H
