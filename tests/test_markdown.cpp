#include "markdown.hpp"
#include <cassert>
#include <string>
#include <vector>

static std::vector<StyledLine> render(const std::string& src, int width) {
  std::vector<StyledLine> out;
  std::string msg;
  bool ok = render_markdown(src, width, out, msg);
  assert(ok);
  (void)ok;
  return out;
}

int main() {
  auto out = render("# Title\n## Sub **bold**\nplain text", 40);
  assert(out.size() == 5);
  assert(out[0].text == "TITLE" && out[0].style == Style::Heading);
  assert(out[1].text.empty());
  assert(out[2].text == "Sub bold" && out[2].style == Style::Heading);
  assert(out[4].text == "plain text" && out[4].style == Style::Normal);

  // asterisks that do not open a span stay literal
  out = render("2**10 is 1024", 40);
  assert(out.size() == 1 && out[0].text == "2**10 is 1024");

  out = render("**all strong**\n\n*all emph*\n\nmixed **part** `code`", 40);
  assert(out.size() == 5);
  assert(out[0].text == "all strong" && out[0].style == Style::Strong);
  assert(out[2].text == "all emph" && out[2].style == Style::Emphasis);
  assert(out[4].text == "mixed part code" && out[4].style == Style::Normal);

  out = render("see [docs](http://x.io) and <http://y.io>", 60);
  assert(out[0].text == "see docs <http://x.io> and http://y.io");

  // tight lists wrap with a hanging indent and nest under the item text
  out = render("- alpha beta gamma delta\n  - inner\n- two", 14);
  assert(out.size() == 4);
  assert(out[0].text == "• alpha beta");
  assert(out[1].text == "  gamma delta");
  assert(out[2].text == "  • inner");
  assert(out[3].text == "• two");

  out = render("3) third\n4) fourth", 20);
  assert(out.size() == 2);
  assert(out[0].text == "3) third" && out[1].text == "4) fourth");

  out = render("> quoted\n> more\n\n\n\nafter\n\n", 40);
  assert(out.size() == 4);
  assert(out[0].text == "│ quoted" && out[0].style == Style::Quote);
  assert(out[1].text == "│ more");
  assert(out[2].text.empty());
  assert(out[3].text == "after");

  // fenced code is kept verbatim, including markup characters
  out = render("```\n# not a heading\n  - not a list\n```\n---", 30);
  assert(out.size() == 4);
  assert(out[0].text == "  # not a heading" && out[0].style == Style::Code);
  assert(out[1].text == "    - not a list");
  assert(out[3].style == Style::Muted && out[3].text.rfind("─", 0) == 0);

  // long words are split at the width
  auto words = wrap_words("abcdefghij xy", 4);
  assert(words.size() == 4);
  assert(words[0] == "abcd" && words[1] == "efgh" && words[2] == "ij" && words[3] == "xy");

  std::vector<StyledLine> none;
  std::string msg;
  assert(!render_markdown("text", 3, none, msg));
  assert(!msg.empty());

  auto plain = wrap_plain("abcdef\n\nxy", 4);
  assert(plain.size() == 4);
  assert(plain[0].text == "abcd" && plain[1].text == "ef" && plain[2].text.empty() && plain[3].text == "xy");
  return 0;
}
