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

// the job runner takes one conversion job through the engine: check
// the source, build the filter graph(s), run the engine in a scoped
// subprocess, validate what came out and report a job_result_t. A job
// is either a full conversion (projection, optionally followed by a
// masking pass on the projected frames) or, for already projected
// dual fisheye input, a masking pass alone. The runner makes exactly
// one attempt and never throws: every failure is reported in the
// result. Retries are up to the batch scheduler.

#ifndef LRVUTIL_JOB_RUNNER_H
#define LRVUTIL_JOB_RUNNER_H

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "common.h"
#include "filter_graph.h"
#include "lrvutil_basic.h"
#include "probe.h"

namespace lrvutil
{

struct conversion_job_t
{
  std::string source ;
  std::string destination ;
  projection_spec_t projection ;
  encoding_profile_t profile ;

  // composite the dual-circle mask over the projected frames

  bool masking = false ;

  // the source is dual fisheye already: only apply the mask

  bool mask_only = false ;

  // if positive, process only this many seconds (masking passes only)

  double duration_limit = 0.0 ;
} ;

typedef enum
{
  JOB_SUCCEEDED ,
  JOB_FAILED ,
  JOB_CANCELLED
} job_status_t ;

const char * const job_status_name[]
{
  "succeeded" ,
  "failed" ,
  "cancelled"
} ;

struct job_result_t
{
  std::string source ;
  std::string destination ;
  job_status_t status = JOB_FAILED ;
  error_kind_t error_kind = ERR_NONE ;
  std::string error_detail ;

  // validation findings, e.g. a frame size mismatch or missing audio

  std::vector < std::string > findings ;

  double elapsed = 0.0 ;             // wall time in seconds
  std::uintmax_t output_size = 0 ;   // bytes
  int attempts = 1 ;

  bool succeeded() const
  {
    return status == JOB_SUCCEEDED ;
  }

  // one line: source -> destination (size, time), or the error

  friend std::ostream & operator<<
    ( std::ostream & osr , const job_result_t & r ) ;
} ;

struct runner_config_t
{
  // the engine executable, looked up in PATH unless it has a slash

  std::string engine = "ffmpeg" ;

  // per engine invocation, in seconds. zero: no timeout

  double timeout = 0.0 ;

  // container inspection. If not set, a libav_probe_t is used.

  std::shared_ptr < const media_probe_t > probe ;
} ;

// create 'dir' and any missing parents. An existing directory is fine;
// throws IO_FAILED if one can't be created.

void create_directories ( const std::string & dir ) ;

class job_runner
{
public:

  explicit job_runner ( runner_config_t config = runner_config_t() ) ;

  // run the job once. A missing destination directory is created. If
  // 'cancel' is set while the engine runs, the engine is terminated and
  // the result is JOB_CANCELLED.

  job_result_t run ( const conversion_job_t & job ,
                     const cancel_token_t * cancel = nullptr ) const ;

  const runner_config_t & config() const
  {
    return cfg ;
  }

private:

  runner_config_t cfg ;

  // run one engine pass writing 'output'; throws lrvutil::error

  void invoke ( const command_spec_t & cmd ,
                const std::string & output ,
                const cancel_token_t * cancel ) const ;

  // the masking pass: generate the mask at the given size, store it in
  // a scoped temp file and composite

  void mask_pass ( const std::string & source ,
                   const std::string & output ,
                   const v2i_t & size ,
                   const conversion_job_t & job ,
                   const cancel_token_t * cancel ) const ;

  // post-conversion checks, returning the findings

  std::vector < std::string > validate_output
    ( const std::string & output ,
      const v2i_t & expected_size ,
      bool expect_audio ,
      std::uintmax_t & output_size ) const ;
} ;

} ; // namespace lrvutil

#endif // LRVUTIL_JOB_RUNNER_H
