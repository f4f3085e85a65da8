#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <cwchar>

namespace dustpan::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

static size_t skip_csi(const std::string& s, size_t i) {
  i += 2;
  while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
  if (i < s.size()) i++; // final byte
  return i;
}

static char32_t decode_u8(const std::string& s, size_t i, int len) {
  auto c = static_cast<unsigned char>(s[i]);
  if (len == 1) return c;
  char32_t cp = (len == 2) ? (c & 0x1F) : (len == 3) ? (c & 0x0F) : (c & 0x07);
  for (int k = 1; k < len; ++k) cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
  return cp;
}

// Columns of one code point. Emoji and CJK are wide even when the C locale
// leaves wcwidth() clueless.
static int cp_cols(char32_t cp) {
  if (cp < 0x80) return 1;
  int w = ::wcwidth(static_cast<wchar_t>(cp));
  if (w >= 0) return w == 0 ? 0 : w;
  if ((cp >= 0x1F300 && cp <= 0x1FAFF) || (cp >= 0x2E80 && cp <= 0x9FFF) || (cp >= 0xAC00 && cp <= 0xD7A3))
    return 2;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') { i = skip_csi(s, i); continue; }
    int len = u8_len(static_cast<unsigned char>(s[i]));
    if (i + static_cast<size_t>(len) > s.size()) len = 1;
    cols += cp_cols(decode_u8(s, i, len));
    i += len;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size()) {
    // Copy ANSI escape sequences without counting them
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      size_t start = i;
      i = skip_csi(s, i);
      out.append(s, start, i - start);
      continue;
    }
    int len = u8_len(static_cast<unsigned char>(s[i]));
    if (i + static_cast<size_t>(len) > s.size()) len = 1;
    int w = cp_cols(decode_u8(s, i, len));
    if (seen + w > cols) break;
    out.append(s, i, len);
    i += len;
    seen += w;
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  std::string cut = take_cols(s, w - 1) + (use_unicode()? "…" : ".");
  int got = display_cols(cut);
  return got < w ? cut + std::string(w - got, ' ') : cut;
}

std::string rpad_trunc(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return std::string(w - cols, ' ') + s;
  return take_cols(s, w);
}

std::string lr_align(int iw, const std::string& left, const std::string& right){
  if (iw <= 0) return std::string();
  int rvis = display_cols(right);
  int tlw = iw - rvis - 1;
  if (tlw < 0) tlw = 0;
  std::string l = trunc_pad(left, tlw);
  int lvis = display_cols(l);
  int space = iw - lvis - rvis;
  if (space < 0) space = 0;
  return l + std::string(space, ' ') + right;
}

} // namespace dustpan::ui
