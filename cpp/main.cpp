#include "extractor/main.hpp"
#include "orchestrator/main.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

class MoveboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit MoveboxMain(kj::ProcessContext& context)
      : context(context), rm(&context), em(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Movebox (" + util::version + ")",
                           "Runs untrusted move-selection code")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "run a submission and print its move")
        .addSubCommand("extract", KJ_BIND_METHOD(em, getMain),
                       "find a move in free text")
        .build();
  }

 private:
  kj::ProcessContext& context;
  orchestrator::Main rm;
  extractor::Main em;
};

KJ_MAIN(MoveboxMain);
