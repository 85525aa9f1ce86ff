#ifndef INCLUDE_SNIPBOX_LOGGER_H_
#define INCLUDE_SNIPBOX_LOGGER_H_

// Keeps the console sinks usable in children forked while another thread logs.
// Call once after the default logger is configured.
void InitLogger();

#endif  // INCLUDE_SNIPBOX_LOGGER_H_
