#include <gtest/gtest.h>

// This test ensures that every public header compiles cleanly when included
// together (common for downstream users).

#include "kulid/cli/commands.hpp"
#include "kulid/cli/config.hpp"
#include "kulid/cli/options.hpp"
#include "kulid/core/buffer.hpp"
#include "kulid/core/errors.hpp"
#include "kulid/core/types.hpp"
#include "kulid/db/schema.hpp"
#include "kulid/id/codec.hpp"
#include "kulid/id/id.hpp"
#include "kulid/id/kind.hpp"
#include "kulid/ulid/entropy.hpp"
#include "kulid/ulid/ulid.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
