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


#include <algorithm>
#include <mutex>
#include <system_error>
#include <thread>

#include <OpenImageIO/filesystem.h>
#include <OpenImageIO/strutil.h>

#include "batch.h"
#include "lrvutil_log.h"

namespace lrvutil
{

using OIIO::Strutil::fmt::format ;

void batch_report_t::record ( const job_result_t & result )
{
  results.push_back ( result ) ;
  switch ( result.status )
  {
    case JOB_SUCCEEDED:
      ++succeeded ;
      break ;
    case JOB_FAILED:
      ++failed ;
      break ;
    case JOB_CANCELLED:
      ++cancelled ;
      break ;
  }
}

std::ostream & operator<< ( std::ostream & osr ,
                            const batch_report_t & report )
{
  std::string rule ( 60 , '=' ) ;

  osr << rule << std::endl
      << "BATCH CONVERSION SUMMARY" << std::endl
      << rule << std::endl
      << "Total files processed: " << report.total << std::endl
      << "Successful: " << report.succeeded << std::endl
      << "Failed: " << report.failed << std::endl ;

  if ( report.cancelled )
    osr << "Cancelled: " << report.cancelled << std::endl ;

  osr << format ( "Total time: {:.1f} seconds" , report.elapsed )
      << std::endl ;

  if ( report.total )
    osr << format ( "Average time per file: {:.1f} seconds" ,
                    report.elapsed / report.total )
        << std::endl ;

  if ( report.failed )
  {
    osr << std::endl << "Failed files:" << std::endl ;
    for ( const auto & r : report.results )
    {
      if ( r.status == JOB_FAILED )
        osr << "  " << OIIO::Filesystem::filename ( r.source ) << ": "
            << error_kind_name [ r.error_kind ] << ": "
            << r.error_detail << std::endl ;
    }
  }
  return osr ;
}

bool has_360_extension ( const std::string & path )
{
  return OIIO::Strutil::iends_with ( path , ".360" ) ;
}

std::vector < std::string > find_input_files ( const std::string & input_dir )
{
  std::vector < std::string > entries ;
  if ( ! OIIO::Filesystem::get_directory_entries ( input_dir , entries ,
                                                   false ) )
    throw error ( IO_FAILED , "can't list directory " + input_dir ) ;

  std::vector < std::string > files ;
  for ( const auto & entry : entries )
  {
    if (    OIIO::Filesystem::is_regular ( entry )
         && has_360_extension ( entry ) )
      files.push_back ( entry ) ;
  }
  std::sort ( files.begin() , files.end() ) ;
  return files ;
}

namespace
{
  // file name without directory and extension

  std::string file_stem ( const std::string & path )
  {
    std::string stem = OIIO::Filesystem::filename ( path ) ;
    auto dot = stem.rfind ( '.' ) ;
    if ( dot != std::string::npos && dot > 0 )
      stem = stem.substr ( 0 , dot ) ;
    return stem ;
  }

  std::string join_path ( const std::string & dir ,
                          const std::string & name )
  {
    if ( dir.empty() )
      return name ;
    if ( dir.back() == '/' )
      return dir + name ;
    return dir + "/" + name ;
  }
} ;

std::string destination_for ( const std::string & source ,
                              const std::string & output_dir ,
                              bool masking )
{
  return join_path ( output_dir ,
                       file_stem ( source )
                     + ( masking ? "_fisheye_masked.mp4" : "_fisheye.mp4" ) ) ;
}

std::string masked_destination_for ( const std::string & source ,
                                     bool test_mode )
{
  return join_path ( OIIO::Filesystem::parent_path ( source ) ,
                       file_stem ( source )
                     + ( test_mode ? "_test_masked.mp4" : "_masked.mp4" ) ) ;
}

int default_worker_count()
{
  int hw = int ( std::thread::hardware_concurrency() ) ;
  if ( hw < 1 )
    hw = 1 ;
  return std::min ( hw , default_worker_cap ) ;
}

int effective_worker_count ( int requested )
{
  if ( requested < 0 )
    throw error ( INVALID_SPEC ,
                  "worker count must be positive, got "
                  + std::to_string ( requested ) ) ;
  if ( requested == 0 )
    return default_worker_count() ;
  if ( requested > max_workers )
  {
    log_warning ( format ( "{} workers requested, using {}: each engine "
                           "instance needs a lot of memory" ,
                           requested , max_workers ) ) ;
    return max_workers ;
  }
  return requested ;
}

// bad input or a bad spec won't improve on a second try

bool is_retryable ( error_kind_t kind )
{
  return    kind == ENGINE_FAILED
         || kind == TIMEOUT
         || kind == OUTPUT_VALIDATION_FAILED ;
}

batch_scheduler::batch_scheduler ( runner_config_t config )
: runner ( config )
{ }

batch_report_t batch_scheduler::run_batch
  ( const std::string & input_dir ,
    const std::string & output_dir ,
    const batch_options_t & options )
{
  if ( ! OIIO::Filesystem::is_directory ( input_dir ) )
    throw error ( INVALID_SPEC ,
                  "input directory does not exist: " + input_dir ) ;

  auto files = find_input_files ( input_dir ) ;
  if ( files.empty() )
    throw error ( NO_INPUT_FILES , "no .360 files found in " + input_dir ) ;

  int workers = effective_worker_count ( options.workers ) ;

  if ( options.retries < 0 )
    throw error ( INVALID_SPEC , "retry count can't be negative" ) ;

  validate ( options.profile ) ;
  validate ( options.projection ) ;

  create_directories ( output_dir ) ;

  std::vector < conversion_job_t > jobs ;
  for ( const auto & file : files )
  {
    conversion_job_t job ;
    job.source = file ;
    job.destination = destination_for ( file , output_dir ,
                                        options.masking ) ;
    job.projection = options.projection ;
    job.profile = options.profile ;
    job.masking = options.masking ;
    jobs.push_back ( job ) ;
  }

  log_info ( format ( "Found {} .360 files to process" , jobs.size() ) ) ;
  log_info ( format ( "Processing with {} parallel workers..." ,
                      std::min ( std::size_t ( workers ) , jobs.size() ) ) ) ;

  return run_jobs ( jobs , workers , options.retries ) ;
}

batch_report_t batch_scheduler::run_batch
  ( const std::string & input_dir ,
    const std::string & output_dir ,
    const encoding_profile_t & profile ,
    bool masking ,
    int workers )
{
  batch_options_t options ;
  options.profile = profile ;
  options.masking = masking ;
  options.workers = workers ;
  return run_batch ( input_dir , output_dir , options ) ;
}

job_result_t batch_scheduler::run_with_retries
  ( const conversion_job_t & job , int retries )
{
  job_result_t result ;
  int attempt = 0 ;

  while ( true )
  {
    result = runner.run ( job , &token ) ;
    ++attempt ;

    if (    result.succeeded()
         || attempt > retries
         || token.cancelled()
         || ! is_retryable ( result.error_kind ) )
      break ;

    log_warning ( format ( "retrying {} ({} of {} attempts failed): {}" ,
                           OIIO::Filesystem::filename ( job.source ) ,
                           attempt , retries + 1 ,
                           error_kind_name [ result.error_kind ] ) ) ;
  }

  result.attempts = attempt ;
  return result ;
}

batch_report_t batch_scheduler::run_jobs
  ( const std::vector < conversion_job_t > & jobs ,
    int workers ,
    int retries )
{
  if ( workers < 1 )
    throw error ( INVALID_SPEC , "need at least one worker" ) ;

  auto start = LRVUTIL_NOW() ;

  batch_report_t report ;
  report.total = jobs.size() ;

  std::mutex queue_mutex ;
  std::mutex report_mutex ;
  std::size_t next_job = 0 ;

  // hand out the next job index, unless the batch was cancelled

  auto fetch = [&] ( std::size_t & index ) -> bool
  {
    std::lock_guard < std::mutex > lock ( queue_mutex ) ;
    if ( token.cancelled() || next_job >= jobs.size() )
      return false ;
    index = next_job++ ;
    return true ;
  } ;

  auto worker = [&]()
  {
    std::size_t index ;
    while ( fetch ( index ) )
    {
      job_result_t result = run_with_retries ( jobs [ index ] , retries ) ;

      batch_report_t snapshot ;
      {
        std::lock_guard < std::mutex > lock ( report_mutex ) ;
        report.record ( result ) ;
        snapshot = report ;
      }

      log_debug ( format ( "job {} of {} done: {}" , snapshot.results.size() ,
                           snapshot.total ,
                           job_status_name [ result.status ] ) ) ;

      // the callback runs without the lock

      if ( progress )
      {
        try
        {
          progress ( result , snapshot ) ;
        }
        catch ( const std::exception & e )
        {
          log_warning ( std::string ( "progress callback failed: " )
                        + e.what() ) ;
        }
      }
    }
  } ;

  std::size_t nthreads = std::min ( std::size_t ( workers ) , jobs.size() ) ;
  std::vector < std::thread > pool ;

  try
  {
    for ( std::size_t i = 0 ; i < nthreads ; i++ )
      pool.emplace_back ( worker ) ;
  }
  catch ( const std::system_error & e )
  {
    // carry on with the threads we have, if any

    if ( pool.empty() )
      throw error ( ENGINE_FAILED ,
                    std::string ( "can't start worker threads: " )
                    + e.what() ) ;
    log_warning ( format ( "only {} of {} worker threads started: {}" ,
                           pool.size() , nthreads , e.what() ) ) ;
  }

  for ( auto & t : pool )
    t.join() ;

  // jobs which were never handed out

  for ( std::size_t i = next_job ; i < jobs.size() ; i++ )
  {
    job_result_t result ;
    result.source = jobs[i].source ;
    result.destination = jobs[i].destination ;
    result.status = JOB_CANCELLED ;
    result.error_kind = CANCELLED ;
    result.error_detail = "cancelled before start" ;
    result.attempts = 0 ;
    report.record ( result ) ;
  }

  report.elapsed = seconds_between ( start , LRVUTIL_NOW() ) ;
  return report ;
}

} ; // namespace lrvutil
