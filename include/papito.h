#ifndef PAPITO_H
#define PAPITO_H

#include <string>

// Hardware counters around benchmark regions, backed by PAPI.
// Events come from the file named by PAPITO_COUNTERS (default counters.in),
// one per line; blank lines and lines starting with '#' are ignored.
void papito_init();                        // initializes PAPI and builds the event set
void papito_start();                       // starts counting
void papito_end(const std::string &label); // stops and prints counters for label to stderr
void papito_finalize();                    // releases the event set and shuts PAPI down

#endif // PAPITO_H
