#pragma once

namespace tinykey {

// Exit codes: 0 success or valid key, 1 usage or runtime error, 2 key failed verification.
int RunCliMain(int argc, char* argv[]);

}  // namespace tinykey
