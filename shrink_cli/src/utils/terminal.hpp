#ifndef SHRINK_TERMINAL_HPP
#define SHRINK_TERMINAL_HPP

/// Columns of the terminal attached to stdout, 80 when unknown.
unsigned get_terminal_width();

bool is_stdout_a_tty();
bool is_stderr_a_tty();

#endif // SHRINK_TERMINAL_HPP
