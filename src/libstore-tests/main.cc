#include <gtest/gtest.h>

#include "arbor/store/globals.hh"

using namespace arbor;

int main(int argc, char ** argv)
{
    /* Tests must not depend on the configuration of the machine
       running them. */
    initLibStore(false);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
