#include <gitchurn/app.hpp>

int main(int argc, char **argv) { return gitchurn::App{}.run(argc, argv); }
