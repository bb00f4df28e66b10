#include "output/stdout_sink.hpp"

#include <cstdio>
#include <string_view>

namespace nexusexec {

// Streamed program output arrives in arbitrary chunks; flush so a prompt without a newline shows up
void StdoutSink::write(std::string_view str) {
    std::fwrite(str.data(), 1, str.size(), stdout);
    std::fflush(stdout);
}

void StdoutSink::flush() {
    std::fflush(stdout);
}

} // namespace nexusexec
