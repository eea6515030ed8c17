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

// the batch scheduler converts every recognised file of a directory.
// It builds one conversion job per file and hands the jobs to a fixed
// set of worker threads; each worker blocks on its engine process, so
// 'workers' bounds the number of engine instances running at once.
// Results are collected in completion order under a mutex, and each
// completed job is passed to the progress callback right away, outside
// that mutex. A
// failed job never stops the batch. cancel() stops handing out jobs
// and terminates the engines which are still running; the report then
// lists the jobs which finished plus a 'cancelled' entry for each job
// which was running or never started.

#ifndef LRVUTIL_BATCH_H
#define LRVUTIL_BATCH_H

#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "common.h"
#include "job_runner.h"
#include "lrvutil_basic.h"

namespace lrvutil
{

// each concurrent engine may hold GBs of frame buffers, so the worker
// count is bounded

const int default_worker_cap = 4 ;
const int max_workers = 8 ;

struct batch_options_t
{
  encoding_profile_t profile = profile_by_name ( "balanced" ) ;
  projection_spec_t projection ;
  bool masking = false ;

  // zero: default_worker_count()

  int workers = 0 ;

  // extra attempts for jobs which failed in the engine or validation

  int retries = 0 ;
} ;

struct batch_report_t
{
  std::size_t total = 0 ;
  std::size_t succeeded = 0 ;
  std::size_t failed = 0 ;
  std::size_t cancelled = 0 ;
  double elapsed = 0.0 ;

  // in completion order, not submission order

  std::vector < job_result_t > results ;

  bool completed_with_failures() const
  {
    return failed > 0 ;
  }

  bool all_succeeded() const
  {
    return succeeded == total ;
  }

  void record ( const job_result_t & result ) ;

  // the summary block, with the failed files and their reasons

  friend std::ostream & operator<<
    ( std::ostream & osr , const batch_report_t & report ) ;
} ;

// called once per completed job, with a snapshot of the report taken
// when the job was recorded. Calls come from the worker threads and may
// overlap, so the callback must be thread-safe; it may call
// batch_scheduler::cancel().

typedef std::function < void ( const job_result_t & ,
                               const batch_report_t & ) >
  progress_callback_t ;

// true if the file name ends in .360, in any case

bool has_360_extension ( const std::string & path ) ;

// the .360 files (case-insensitive) directly in input_dir, sorted

std::vector < std::string > find_input_files ( const std::string & input_dir ) ;

// <output_dir>/<stem>_fisheye.mp4, or <stem>_fisheye_masked.mp4

std::string destination_for ( const std::string & source ,
                              const std::string & output_dir ,
                              bool masking ) ;

// the default output of a masking-only run: <stem>_masked.mp4, or
// <stem>_test_masked.mp4 for a truncated test run, next to the source

std::string masked_destination_for ( const std::string & source ,
                                     bool test_mode ) ;

// hardware threads, at most default_worker_cap

int default_worker_count() ;

// zero: the default; larger than max_workers: capped, with a warning.
// throws INVALID_SPEC for negative counts

int effective_worker_count ( int requested ) ;

bool is_retryable ( error_kind_t kind ) ;

class batch_scheduler
{
public:

  explicit batch_scheduler ( runner_config_t config = runner_config_t() ) ;

  void on_progress ( progress_callback_t callback )
  {
    progress = callback ;
  }

  // throws NO_INPUT_FILES if there is nothing to convert, INVALID_SPEC
  // if input_dir is not a directory and IO_FAILED if output_dir can't
  // be created. Job failures end up in the report.

  batch_report_t run_batch ( const std::string & input_dir ,
                             const std::string & output_dir ,
                             const batch_options_t & options ) ;

  batch_report_t run_batch ( const std::string & input_dir ,
                             const std::string & output_dir ,
                             const encoding_profile_t & profile ,
                             bool masking ,
                             int workers ) ;

  // run a given list of jobs on 'workers' threads

  batch_report_t run_jobs ( const std::vector < conversion_job_t > & jobs ,
                            int workers ,
                            int retries = 0 ) ;

  // may be called from any thread. Once cancelled, the scheduler
  // stays cancelled.

  void cancel()
  {
    token.cancel() ;
  }

  bool cancelled() const
  {
    return token.cancelled() ;
  }

  cancel_token_t & cancel_token()
  {
    return token ;
  }

private:

  job_runner runner ;
  cancel_token_t token ;
  progress_callback_t progress ;

  job_result_t run_with_retries ( const conversion_job_t & job ,
                                  int retries ) ;
} ;

} ; // namespace lrvutil

#endif // LRVUTIL_BATCH_H
