#ifndef SRC_LANGMATCH_EXIT_CODE_H_
#define SRC_LANGMATCH_EXIT_CODE_H_

namespace langmatch {
#define EXIT_CODE_LIST(V)                                                      \
  V(NoFailure, 0)                                                              \
  /* Data file missing or rejected. */                                         \
  V(GenericUserError, 1)                                                       \
  V(InvalidCommandLineArgument, 9)                                             \
  /* CHECK failures abort, which the shell reports as 128 + SIGABRT. */        \
  V(Abort, 134)

enum class ExitCode : int {
#define V(Name, Code) k##Name = Code,
  EXIT_CODE_LIST(V)
#undef V
};

}  // namespace langmatch

#endif  // SRC_LANGMATCH_EXIT_CODE_H_
