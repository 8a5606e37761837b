#include <privdrop/app.hpp>

int main(int argc, char **argv) { return privdrop::App{}.run(argc, argv); }
