#include "fin_pdf_page_reader.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

using namespace std;
using namespace PoDoFo;

// TJ offsets (thousandths of an em) beyond this read as a word gap
constexpr double TJ_SPACE_THRESHOLD = 250.0;
// Horizontal gaps (in ems) joining shown strings into one run, and the gap
// at which the join gets a space
constexpr double RUN_GAP_EM = 1.0;
constexpr double SPACE_GAP_EM = 0.15;

struct fin_pdf_page_reader::graphics_state
{
  graphics_state()
  {
    CTM = Matrix();
    T_m = Matrix();
    T_lm = Matrix();
    PdfState.FontSize = -1;
  }

  Matrix CTM;
  Matrix T_m;
  Matrix T_lm;
  double T_l = 0;
  PdfTextState PdfState;

  Matrix T_rm() const { return T_m * CTM; }
};

struct fin_pdf_page_reader::path_state
{
  bool empty = true;
  double min_x = 0, min_y = 0, max_x = 0, max_y = 0;
  double cur_x = 0, cur_y = 0;

  void add_point(const Matrix& ctm, double x, double y)
  {
    Vector2 p = Vector2(x, y) * ctm;
    if (empty) {
      min_x = max_x = p.X;
      min_y = max_y = p.Y;
      empty = false;
    } else {
      min_x = std::min(min_x, p.X);
      max_x = std::max(max_x, p.X);
      min_y = std::min(min_y, p.Y);
      max_y = std::max(max_y, p.Y);
    }
    cur_x = x;
    cur_y = y;
  }

  void reset()
  {
    empty = true;
  }
};

namespace {
  // Length of a unit vector along x (or y) after applying m
  double axis_scale(const Matrix& m, double ux, double uy)
  {
    Vector2 origin = Vector2(0, 0) * m;
    Vector2 unit = Vector2(ux, uy) * m;
    return (unit - origin).GetLength();
  }

  fin_string clean_font_name(const PdfFont* font)
  {
    if (font == nullptr) {
      return fin_string();
    }
    string font_name(font->GetName());
    size_t plus_pos = font_name.find('+');
    if (plus_pos != string::npos) {
      font_name = font_name.substr(plus_pos + 1);
    }
    return font_name;
  }
}

class fin_pdf_page_reader::page_context
{
public:
  page_context(const PdfPage& page, fin_page_record& record)
    : m_page(page), m_record(record)
  {
    Rect rect = page.GetRect();
    m_left = rect.X;
    m_top = rect.Y + rect.Height;
    States.push_back(graphics_state());
  }

  std::vector<graphics_state> States;
  path_state Path;

  graphics_state& current() { return States.back(); }

  void q_Operator()
  {
    States.push_back(States.back());
  }

  void Q_Operator()
  {
    // Unbalanced Q is common in broken producers
    if (States.size() > 1) {
      States.pop_back();
    }
  }

  void BT_Operator()
  {
    current().T_m = Matrix();
    current().T_lm = Matrix();
  }

  void cm_Operator(double a, double b, double c, double d, double e, double f)
  {
    Matrix transform(a, b, c, d, e, f);
    current().CTM = transform * current().CTM;
  }

  void Tm_Operator(double a, double b, double c, double d, double e, double f)
  {
    current().T_m = Matrix(a, b, c, d, e, f);
    current().T_lm = current().T_m;
  }

  void TdTD_Operator(double tx, double ty)
  {
    Matrix transform = Matrix::CreateTranslation(Vector2(tx, ty));
    current().T_lm = transform * current().T_lm;
    current().T_m = current().T_lm;
  }

  void TStar_Operator()
  {
    TdTD_Operator(0, -current().T_l);
  }

  void advance(double tx)
  {
    Matrix transform = Matrix::CreateTranslation(Vector2(tx, 0));
    current().T_m = transform * current().T_m;
  }

  void Tf_Operator(const PdfName& fontname, double fontsize)
  {
    current().PdfState.FontSize = fontsize;
    try {
      auto resources = m_page.GetResources();
      current().PdfState.Font = resources.GetFont(fontname);
    } catch (const std::exception& e) {
      std::cerr << "[PDF] font " << fontname.GetString() << " unavailable: " << e.what() << std::endl;
      current().PdfState.Font = nullptr;
    }
  }

  // Decode one string operand and return its advance in text space
  double scan_string(const PdfString& encoded, string& decoded)
  {
    vector<double> lengths;
    vector<unsigned> positions;
    decoded.clear();
    const PdfTextState& state = current().PdfState;
    if (state.Font == nullptr) {
      decoded = encoded.GetString();
    } else {
      state.Font->TryScanEncodedString(encoded, state, decoded, lengths, positions);
    }

    double total = 0.0;
    for (double len : lengths) {
      total += len;
    }
    if (total <= 0.0 && !decoded.empty()) {
      total = decoded.length() * font_size() * 0.5;
    }
    return total;
  }

  double font_size()
  {
    double size = current().PdfState.FontSize;
    return size > 0 ? size : 12.0;
  }

  void add_span(const string& text, const Vector2& start, const Vector2& end)
  {
    if (text.find_first_not_of(" \t\n\r") == string::npos) {
      return;
    }
    Matrix T_rm = current().T_rm();
    double size = font_size() * axis_scale(T_rm, 0, 1);
    double width = std::abs(end.X - start.X);
    if (width <= 0.0) {
      width = text.length() * size * 0.5;
    }

    fin_string font_name = clean_font_name(current().PdfState.Font);

    m_record.spans.add_element();
    fin_layout_span& span = m_record.spans.back();
    span.text = fin_string(text);
    span.set_bounds(std::min(start.X, end.X) - m_left, m_top - start.Y - size, width, size);
    span.font_size = size;
    span.font_family = font_name;
    span.bold = font_name.lower().contains("bold");
  }

  void show_string(const PdfString& str)
  {
    string decoded;
    Vector2 start = current().T_rm().GetTranslationVector();
    double advance_by = scan_string(str, decoded);
    advance(advance_by);
    Vector2 end = current().T_rm().GetTranslationVector();
    add_span(decoded, start, end);
  }

  void show_array(const PdfArray& arr)
  {
    string combined;
    Vector2 start = current().T_rm().GetTranslationVector();
    for (unsigned i = 0; i < arr.size(); i++)
    {
      const PdfObject& item = arr[i];
      if (item.IsString())
      {
        string decoded;
        double advance_by = scan_string(item.GetString(), decoded);
        combined += decoded;
        advance(advance_by);
      }
      else if (item.IsNumberOrReal())
      {
        double value = item.GetReal();
        double t_j = -value / 1000.0 * current().PdfState.FontSize * current().PdfState.FontScale;
        advance(t_j);
        if (-value > TJ_SPACE_THRESHOLD && !combined.empty() && combined.back() != ' ') {
          combined += ' ';
        }
      }
    }
    Vector2 end = current().T_rm().GetTranslationVector();
    add_span(combined, start, end);
  }

  void paint_path(bool fill, bool stroke)
  {
    if (!Path.empty) {
      m_record.paths.add_element();
      fin_layout_path& path = m_record.paths.back();
      path.set_edges(Path.min_x - m_left, m_top - Path.max_y, Path.max_x - m_left, m_top - Path.min_y);
      path.has_fill = fill;
      path.has_stroke = stroke;
    }
    Path.reset();
  }

  void add_image(const PdfXObject& xobject)
  {
    const Matrix& ctm = current().CTM;
    path_state box;
    box.add_point(ctm, 0, 0);
    box.add_point(ctm, 1, 0);
    box.add_point(ctm, 0, 1);
    box.add_point(ctm, 1, 1);

    m_record.images.add_element();
    fin_layout_image& image = m_record.images.back();
    image.set_edges(box.min_x - m_left, m_top - box.max_y, box.max_x - m_left, m_top - box.min_y);

    const PdfDictionary& dict = xobject.GetDictionary();
    const PdfObject* w = dict.FindKey("Width");
    const PdfObject* h = dict.FindKey("Height");
    image.pixel_width = static_cast<long long>(w != nullptr && w->IsNumber() ? w->GetNumber() : 0);
    image.pixel_height = static_cast<long long>(h != nullptr && h->IsNumber() ? h->GetNumber() : 0);
  }

private:
  const PdfPage& m_page;
  fin_page_record& m_record;
  double m_left;
  double m_top;
};

fin_pdf_page_reader::fin_pdf_page_reader() {
}

bool fin_pdf_page_reader::read_page(const PdfPage& page, fin_page_record& record)
{
  try {
    page_context context(page, record);

    PdfContentReaderArgs args;
    args.Flags = PdfContentReaderFlags::None;

    PdfContentStreamReader reader(page, args);
    PdfContent content;

    while (reader.TryReadNext(content))
    {
      switch (content.Type)
      {
        case PdfContentType::Operator:
        {
          if (content.Warnings != PdfContentWarnings::None)
          {
            // Ignore invalid operators
            continue;
          }

          path_state& path = context.Path;
          const Matrix& ctm = context.current().CTM;

          switch (content.Operator)
          {
            case PdfOperator::q:
              context.q_Operator();
              break;
            case PdfOperator::Q:
              context.Q_Operator();
              break;
            case PdfOperator::cm:
            {
              double a, b, c, d, e, f;
              read(content.Stack, a, b, c, d, e, f);
              context.cm_Operator(a, b, c, d, e, f);
              break;
            }
            case PdfOperator::BT:
              context.BT_Operator();
              break;
            case PdfOperator::ET:
              break;
            case PdfOperator::TL:
              context.current().T_l = content.Stack[0].GetReal();
              break;
            case PdfOperator::Tc:
              context.current().PdfState.CharSpacing = content.Stack[0].GetReal();
              break;
            case PdfOperator::Tw:
              context.current().PdfState.WordSpacing = content.Stack[0].GetReal();
              break;
            case PdfOperator::Tz:
              context.current().PdfState.FontScale = content.Stack[0].GetReal() / 100.0;
              break;
            case PdfOperator::Td:
            case PdfOperator::TD:
            {
              double tx, ty;
              read(content.Stack, tx, ty);
              context.TdTD_Operator(tx, ty);
              if (content.Operator == PdfOperator::TD)
                context.current().T_l = -ty;
              break;
            }
            case PdfOperator::Tm:
            {
              double a, b, c, d, e, f;
              read(content.Stack, a, b, c, d, e, f);
              context.Tm_Operator(a, b, c, d, e, f);
              break;
            }
            case PdfOperator::T_Star:
              context.TStar_Operator();
              break;
            case PdfOperator::Tf:
            {
              double fontSize = content.Stack[0].GetReal();
              const PdfName& fontName = content.Stack[1].GetName();
              context.Tf_Operator(fontName, fontSize);
              break;
            }
            case PdfOperator::Tj:
              context.show_string(content.Stack[0].GetString());
              break;
            case PdfOperator::Quote:
              context.TStar_Operator();
              context.show_string(content.Stack[0].GetString());
              break;
            case PdfOperator::DoubleQuote:
            {
              // aw ac string "
              context.current().PdfState.CharSpacing = content.Stack[1].GetReal();
              context.current().PdfState.WordSpacing = content.Stack[2].GetReal();
              context.TStar_Operator();
              context.show_string(content.Stack[0].GetString());
              break;
            }
            case PdfOperator::TJ:
              context.show_array(content.Stack[0].GetArray());
              break;

            // Path construction
            case PdfOperator::m:
            case PdfOperator::l:
            {
              double x, y;
              read(content.Stack, x, y);
              path.add_point(ctm, x, y);
              break;
            }
            case PdfOperator::c:
            {
              double x1, y1, x2, y2, x3, y3;
              read(content.Stack, x1, y1, x2, y2, x3, y3);
              path.add_point(ctm, x1, y1);
              path.add_point(ctm, x2, y2);
              path.add_point(ctm, x3, y3);
              break;
            }
            case PdfOperator::v:
            case PdfOperator::y:
            {
              double x1 = content.Stack[3].GetReal();
              double y1 = content.Stack[2].GetReal();
              double x2 = content.Stack[1].GetReal();
              double y2 = content.Stack[0].GetReal();
              path.add_point(ctm, x1, y1);
              path.add_point(ctm, x2, y2);
              break;
            }
            case PdfOperator::h:
              break;
            case PdfOperator::re:
            {
              double x = content.Stack[3].GetReal();
              double y = content.Stack[2].GetReal();
              double w = content.Stack[1].GetReal();
              double h = content.Stack[0].GetReal();
              path.add_point(ctm, x, y);
              path.add_point(ctm, x + w, y + h);
              path.cur_x = x;
              path.cur_y = y;
              break;
            }

            // Path painting
            case PdfOperator::S:
            case PdfOperator::s:
              context.paint_path(false, true);
              break;
            case PdfOperator::f:
            case PdfOperator::F:
            case PdfOperator::f_Star:
              context.paint_path(true, false);
              break;
            case PdfOperator::B:
            case PdfOperator::B_Star:
            case PdfOperator::b:
            case PdfOperator::b_Star:
              context.paint_path(true, true);
              break;
            case PdfOperator::n:
              path.reset();
              break;
            default:
              break;
          }
          break;
        }
        case PdfContentType::DoXObject:
        {
          if (content.XObject == nullptr)
            break;
          if (content.XObject->GetType() == PdfXObjectType::Image)
          {
            context.add_image(*content.XObject);
          }
          else if (content.XObject->GetType() == PdfXObjectType::Form)
          {
            // Form content follows inline; its matrix applies until EndXObjectForm
            const PdfXObjectForm& form = static_cast<const PdfXObjectForm&>(*content.XObject);
            context.q_Operator();
            context.current().CTM = form.GetMatrix() * context.current().CTM;
          }
          break;
        }
        case PdfContentType::EndXObjectForm:
          context.Q_Operator();
          break;
        case PdfContentType::ImageData:
        case PdfContentType::ImageDictionary:
        default:
          break;
      }
    }
    merge_runs(record.spans);
    return true;

  } catch (const std::exception& e) {
    last_error = e.what();
    std::cerr << "[PDF] page " << record.page_number.value() << " content stream failed: " << e.what() << std::endl;
    return false;
  }
}

void fin_pdf_page_reader::merge_runs(fin_model_list<fin_layout_span>& spans)
{
  fin_model_list<fin_layout_span> merged;
  for (size_t i = 0; i < spans.size(); i++)
  {
    const fin_layout_span& span = spans[i];
    if (!merged.empty())
    {
      fin_layout_span& run = merged.back();
      double size = std::max(run.font_size.value(), 1.0);
      double gap = span.get_left() - run.get_right();
      bool same_style = run.font_family.value() == span.font_family.value() &&
                        std::abs(run.font_size.value() - span.font_size.value()) < 0.5;
      bool same_line = std::abs(run.get_bottom() - span.get_bottom()) < size * 0.3;
      if (same_style && same_line && gap > -size * 0.5 && gap < size * RUN_GAP_EM)
      {
        fin_string text = run.text.value();
        if (gap > size * SPACE_GAP_EM && !text.ends_with(" ") && !span.text.value().starts_with(" "))
        {
          text += ' ';
        }
        text += span.text.value();
        run.text = text;
        run.unite(span);
        continue;
      }
    }
    merged.push_back(span);
  }

  spans.clear();
  for (size_t i = 0; i < merged.size(); i++)
  {
    spans.push_back(merged[i]);
  }
}

void fin_pdf_page_reader::read(const PdfVariantStack& stack, double &tx, double &ty)
{
  tx = stack[1].GetReal();
  ty = stack[0].GetReal();
}

void fin_pdf_page_reader::read(const PdfVariantStack& stack, double &a, double &b, double &c, double &d, double &e, double &f)
{
  a = stack[5].GetReal();
  b = stack[4].GetReal();
  c = stack[3].GetReal();
  d = stack[2].GetReal();
  e = stack[1].GetReal();
  f = stack[0].GetReal();
}
