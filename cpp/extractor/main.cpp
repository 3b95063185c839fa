#include "extractor/main.hpp"

#include <iostream>
#include <iterator>

#include "extractor/extractor.hpp"
#include "util/version.hpp"

namespace extractor {

kj::MainBuilder::Validity Main::AddText(kj::StringPtr arg) {
  if (has_text) text += " ";
  text += arg.cStr();
  has_text = true;
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  if (!has_text) {
    text.assign(std::istreambuf_iterator<char>(std::cin),
                std::istreambuf_iterator<char>());
  }
  core::MoveCandidate move = Extract(text);
  if (!move.has_move) {
    context.exitError("No move found");
  }
  std::cout << FormatMove(move) << std::endl;
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Movebox Extractor (" + util::version + ")",
                         "Finds a move in the given text, or in standard "
                         "input if no text is given, and prints it as "
                         "\"(row, col)\"")
      .expectZeroOrMoreArgs("<text>", KJ_BIND_METHOD(*this, AddText))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace extractor
