#include "fin_doc_sio.h"
#include <fstream>
#include <iterator>

bool fin_doc_sio::read(fin_string filename)
{
  std::fstream f;
  f.open(filename.c_str(), std::ios::in | std::ios::binary);
  if (!f.is_open())
  {
    last_error = "cannot open " + filename;
    return false;
  }
  // read all bytes from the file
  std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  f.close();

  fin_string str = data;
  if (!parse(str))
  {
    if (last_error.empty())
    {
      last_error = "cannot parse " + filename;
    }
    return false;
  }
  return true;
}
