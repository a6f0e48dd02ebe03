// wallspan.cpp
// MIT License (c) 2026 Pedro

int run_wallspan(int argc, char** argv);

int main(int argc, char** argv) {
    return run_wallspan(argc, argv);
}
