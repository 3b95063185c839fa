#ifndef EXTRACTOR_MAIN_HPP
#define EXTRACTOR_MAIN_HPP
#include <string>

#include <kj/main.h>

namespace extractor {

class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::MainBuilder::Validity AddText(kj::StringPtr text);

  kj::ProcessContext& context;
  std::string text;
  bool has_text = false;
};
}  // namespace extractor
#endif
