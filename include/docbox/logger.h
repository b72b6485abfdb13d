#ifndef INCLUDE_DOCBOX_LOGGER_H_
#define INCLUDE_DOCBOX_LOGGER_H_

// Keep the console sinks usable in children forked from a multi-threaded process
void InitLogger();

#endif  // INCLUDE_DOCBOX_LOGGER_H_
