bool run_parser_tests();

int main(int argc, const char *argv[]) {
    return run_parser_tests() ? EXIT_SUCCESS : EXIT_FAILURE;
}
