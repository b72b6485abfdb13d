#ifndef SERVER_H_
#define SERVER_H_

#include <httplib.h>
#include <docbox/policy.h>

// Number of jobs currently waiting on a worker
int RunningJobs();

// Installs the docboxd routes; jobs run with the given policy, which must
// outlive the server
void SetupRoutes(httplib::Server& svr, const Policy& policy);

#endif  // SERVER_H_
