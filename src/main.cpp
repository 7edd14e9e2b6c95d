// wordmean: words closest to the centroid of a word list
#include "config.hpp"
#include "server.hpp"
#include "util.hpp"
#include "vector_table.hpp"

int main(int argc, char** argv) {
    Config config = load_config(argc, argv);

    LoadResult loaded = load_vector_table(config.vectors_path);
    if (!loaded.ok()) {
        LOG_ERROR(loaded.error);
        LOG_ERROR("Cannot start without a vocabulary");
        return 1;
    }

    Server server(loaded.table, loaded.skipped_lines, config);
    return server.run() ? 0 : 1;
}
