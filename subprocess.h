/************************************************************************/
/*                                                                      */
/*    lrvutil - convert EAC 360 degree video to dual fisheye LRV layout */
/*                                                                      */
/*            Copyright 2024 by Kay F. Jahnke                           */
/*                                                                      */
/*    The git repository for this software is at                        */
/*                                                                      */
/*    https://github.com/kfjahnke/envutil                               */
/*                                                                      */
/*    Please direct questions, bug reports, and contributions to        */
/*                                                                      */
/*    kfjahnke+envutil@gmail.com                                        */
/*                                                                      */
/*    Permission is hereby granted, free of charge, to any person       */
/*    obtaining a copy of this software and associated documentation    */
/*    files (the "Software"), to deal in the Software without           */
/*    restriction, including without limitation the rights to use,      */
/*    copy, modify, merge, publish, distribute, sublicense, and/or      */
/*    sell copies of the Software, and to permit persons to whom the    */
/*    Software is furnished to do so, subject to the following          */
/*    conditions:                                                       */
/*                                                                      */
/*    The above copyright notice and this permission notice shall be    */
/*    included in all copies or substantial portions of the             */
/*    Software.                                                         */
/*                                                                      */
/*    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND    */
/*    EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES   */
/*    OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND          */
/*    NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT       */
/*    HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,      */
/*    WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING      */
/*    FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR     */
/*    OTHER DEALINGS IN THE SOFTWARE.                                   */
/*                                                                      */
/************************************************************************/

// scoped_process runs the external engine as a child process. The
// child gets its own process group, stdin and stdout from /dev/null
// and stderr redirected to a temporary file, so that the tail of the
// engine's diagnostics can be attached to a failed job. The object
// owns the child: on every exit path - normal return, exception,
// timeout or cancellation - the destructor terminates the whole
// process group if it is still running, reaps it and removes the
// stderr file.

#ifndef LRVUTIL_SUBPROCESS_H
#define LRVUTIL_SUBPROCESS_H

#include <string>
#include <vector>

#include <sys/types.h>

#include "common.h"

namespace lrvutil
{

typedef enum
{
  PROCESS_EXITED ,
  PROCESS_TIMED_OUT ,
  PROCESS_CANCELLED
} process_status_t ;

struct process_outcome_t
{
  process_status_t status = PROCESS_EXITED ;

  // the exit code for PROCESS_EXITED. A child which died from a signal
  // gets 128 + signal number, like the shell reports it.

  int exit_code = 0 ;

  // the last lines the child wrote to stderr

  std::string stderr_tail ;
} ;

class scoped_process
{
public:

  // spawns argv[0] (searched in PATH) with the remaining arguments.
  // throws lrvutil::error ( ENGINE_FAILED ) if there is no child; if
  // the executable can't be found, the child exits with 127.

  explicit scoped_process ( const std::vector < std::string > & argv ) ;

  ~scoped_process() ;

  scoped_process ( const scoped_process & ) = delete ;
  scoped_process & operator= ( const scoped_process & ) = delete ;

  // block until the child exits, the timeout (in seconds, zero for
  // none) expires or 'cancel' is set. In the latter two cases the
  // process group is terminated before wait returns.

  process_outcome_t wait ( double timeout = 0.0 ,
                           const cancel_token_t * cancel = nullptr ) ;

  pid_t pid() const
  {
    return child ;
  }

  // the maximal number of bytes kept from the child's stderr

  static constexpr std::size_t tail_size = 4096 ;

private:

  pid_t child = -1 ;
  bool reaped = false ;
  int raw_status = 0 ;
  std::string stderr_path ;

  void terminate() ;
  std::string stderr_tail() const ;
} ;

} ; // namespace lrvutil

#endif // LRVUTIL_SUBPROCESS_H
