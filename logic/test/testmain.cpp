#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "infra/log.h"

int main(int argc, char** argv)
{
    inf::Log::add_console_sink(inf::Log::Colored::On);
    inf::LogRegistration logReg("shipemtest");
    inf::Log::set_level(inf::Log::Level::Warning);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
