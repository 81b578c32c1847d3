#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include "units_test.h"
#include "geometry_test.h"
#include "reader_test.h"
#include "writer_test.h"
#include "structure_test.h"
#include "workaround_test.h"
#include "document_test.h"
#include "config_test.h"
#include "roundtrip_test.h"

int main(int argc, char** argv)
{
    testing::InitGoogleTest(&argc, argv);
    spdlog::set_level(spdlog::level::err);
    return RUN_ALL_TESTS();
}
