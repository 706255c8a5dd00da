#include "terminal.hpp"
#include <cstdio>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

bool is_stdout_a_tty() {
    return isatty(fileno(stdout)) != 0;
}

bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}
