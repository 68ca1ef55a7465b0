#include "markdown.hpp"
#include "config.hpp"
#include "utf8.hpp"
#include <cmark.h>
#include <algorithm>
#include <cctype>
#include <memory>

static std::vector<std::string> split_block_lines(const std::string& block) {
  std::vector<std::string> lines;
  size_t st = 0;
  while (st <= block.size()) {
    size_t pos = block.find('\n', st);
    if (pos == std::string::npos) { lines.emplace_back(block.substr(st)); break; }
    lines.emplace_back(block.substr(st, pos - st));
    st = pos + 1;
  }
  for (auto& l : lines) if (!l.empty() && l.back() == '\r') l.pop_back();
  return lines;
}

static std::string trim_right(std::string s) {
  while (!s.empty() && s.back() == ' ') s.pop_back();
  return s;
}

std::vector<std::string> wrap_words(const std::string& text, int width) {
  std::vector<std::string> out;
  if (width <= 0) return out;
  std::string cur;
  int cur_len = 0;
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == ' ') { i++; continue; }
    size_t j = text.find(' ', i);
    if (j == std::string::npos) j = text.size();
    std::string word = text.substr(i, j - i);
    i = j;
    int wlen = static_cast<int>(utf8_length(word));
    while (wlen > width) {
      if (cur_len > 0) { out.push_back(cur); cur.clear(); cur_len = 0; }
      std::string head = utf8_truncate(word, width);
      out.push_back(head);
      word = word.substr(head.size());
      wlen -= width;
    }
    if (wlen == 0) continue;
    if (cur_len > 0 && cur_len + 1 + wlen > width) {
      out.push_back(cur);
      cur.clear();
      cur_len = 0;
    }
    if (cur_len > 0) { cur += ' '; cur_len++; }
    cur += word;
    cur_len += wlen;
  }
  if (cur_len > 0 || out.empty()) out.push_back(cur);
  return out;
}

namespace {

using NodePtr = std::unique_ptr<cmark_node, decltype(&cmark_node_free)>;
using IterPtr = std::unique_ptr<cmark_iter, decltype(&cmark_iter_free)>;

std::string literal(cmark_node* node) {
  const char* s = cmark_node_get_literal(node);
  return s ? std::string(s) : std::string();
}

// inline content of a leaf block; soft and hard breaks both become '\n'
std::string inline_text(cmark_node* block) {
  std::string out;
  size_t link_start = 0;
  IterPtr it(cmark_iter_new(block), &cmark_iter_free);
  cmark_event_type ev;
  while ((ev = cmark_iter_next(it.get())) != CMARK_EVENT_DONE) {
    cmark_node* n = cmark_iter_get_node(it.get());
    switch (cmark_node_get_type(n)) {
      case CMARK_NODE_TEXT:
      case CMARK_NODE_CODE:
      case CMARK_NODE_HTML_INLINE:
        out += literal(n);
        break;
      case CMARK_NODE_SOFTBREAK:
      case CMARK_NODE_LINEBREAK:
        out += '\n';
        break;
      case CMARK_NODE_LINK:
        if (ev == CMARK_EVENT_ENTER) {
          link_start = out.size();
        } else {
          const char* url = cmark_node_get_url(n);
          if (url && *url && out.compare(link_start, std::string::npos, url) != 0) out += std::string(" <") + url + ">";
        }
        break;
      default:
        break;
    }
  }
  return out;
}

// a paragraph made of a single strong or emph span takes that style
Style paragraph_style(cmark_node* para) {
  cmark_node* only = cmark_node_first_child(para);
  if (!only || cmark_node_next(only)) return Style::Normal;
  if (cmark_node_get_type(only) == CMARK_NODE_STRONG) return Style::Strong;
  if (cmark_node_get_type(only) == CMARK_NODE_EMPH) return Style::Emphasis;
  return Style::Normal;
}

class BlockWriter {
public:
  BlockWriter(int width, std::vector<StyledLine>& out) : width_(width), out_(out) {}

  void children(cmark_node* parent, const std::string& first, const std::string& rest, Style style, bool tight) {
    bool first_child = true;
    for (cmark_node* c = cmark_node_first_child(parent); c; c = cmark_node_next(c)) {
      if (!first_child && !tight) out_.push_back({trim_right(rest), style});
      block(c, first_child ? first : rest, rest, style);
      first_child = false;
    }
  }

private:
  void block(cmark_node* node, const std::string& first, const std::string& rest, Style style) {
    switch (cmark_node_get_type(node)) {
      case CMARK_NODE_PARAGRAPH: {
        Style s = style == Style::Normal ? paragraph_style(node) : style;
        text(first, rest, inline_text(node), s);
      } break;
      case CMARK_NODE_HEADING: {
        std::string t = inline_text(node);
        if (cmark_node_get_heading_level(node) == 1)
          std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        text(first, rest, t, Style::Heading);
      } break;
      case CMARK_NODE_CODE_BLOCK:
      case CMARK_NODE_HTML_BLOCK: {
        std::string code = literal(node);
        if (!code.empty() && code.back() == '\n') code.pop_back();
        auto lines = split_block_lines(code);
        for (size_t i = 0; i < lines.size(); ++i) out_.push_back({(i == 0 ? first : rest) + "  " + lines[i], Style::Code});
      } break;
      case CMARK_NODE_THEMATIC_BREAK: {
        int len = std::min(width_ - static_cast<int>(utf8_length(first)), TERMNOTES_RULE_MAX);
        std::string rule = first;
        for (int i = 0; i < len; ++i) rule += "─";
        out_.push_back({rule, Style::Muted});
      } break;
      case CMARK_NODE_BLOCK_QUOTE:
        children(node, first + "│ ", rest + "│ ", Style::Quote, false);
        break;
      case CMARK_NODE_LIST:
        list(node, first, rest, style);
        break;
      default:
        children(node, first, rest, style, false);
        break;
    }
  }

  void list(cmark_node* node, const std::string& first, const std::string& rest, Style style) {
    bool tight = cmark_node_get_list_tight(node) != 0;
    bool ordered = cmark_node_get_list_type(node) == CMARK_ORDERED_LIST;
    int number = cmark_node_get_list_start(node);
    const char* delim = cmark_node_get_list_delim(node) == CMARK_PAREN_DELIM ? ") " : ". ";
    bool first_item = true;
    for (cmark_node* item = cmark_node_first_child(node); item; item = cmark_node_next(item)) {
      if (!first_item && !tight) out_.push_back({trim_right(rest), style});
      std::string marker = ordered ? std::to_string(number++) + delim : std::string("• ");
      std::string lead = (first_item ? first : rest) + marker;
      if (!cmark_node_first_child(item)) out_.push_back({trim_right(lead), style});
      else children(item, lead, rest + std::string(utf8_length(marker), ' '), style, tight);
      first_item = false;
    }
  }

  void text(const std::string& first, const std::string& rest, const std::string& body, Style style) {
    int prefix = static_cast<int>(std::max(utf8_length(first), utf8_length(rest)));
    int avail = std::max(1, width_ - prefix);
    bool first_line = true;
    for (const std::string& para_line : split_block_lines(body)) {
      for (const std::string& l : wrap_words(para_line, avail)) {
        out_.push_back({(first_line ? first : rest) + l, style});
        first_line = false;
      }
    }
  }

  int width_;
  std::vector<StyledLine>& out_;
};

}

bool render_markdown(const std::string& source, int width, std::vector<StyledLine>& out, std::string& msg) {
  out.clear();
  if (width < 4) { msg = "render width too small: " + std::to_string(width); return false; }
  NodePtr doc(cmark_parse_document(source.data(), source.size(), CMARK_OPT_DEFAULT), &cmark_node_free);
  if (!doc) { msg = "markdown parser returned no document"; return false; }
  BlockWriter(width, out).children(doc.get(), "", "", Style::Normal, false);
  while (!out.empty() && out.back().text.empty()) out.pop_back();
  return true;
}

std::vector<StyledLine> wrap_plain(const std::string& source, int width) {
  std::vector<StyledLine> out;
  for (const std::string& line : split_block_lines(source)) {
    if (line.empty() || width <= 0) { out.push_back({line, Style::Normal}); continue; }
    std::string rest = line;
    while (static_cast<int>(utf8_length(rest)) > width) {
      std::string head = utf8_truncate(rest, width);
      out.push_back({head, Style::Normal});
      rest = rest.substr(head.size());
    }
    out.push_back({rest, Style::Normal});
  }
  return out;
}
