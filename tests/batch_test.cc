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
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <signal.h>

#include <gtest/gtest.h>

#include <OpenImageIO/filesystem.h>

#include "batch.h"
#include "test_helpers.h"

using namespace lrvutil ;
using namespace lrvutil_test ;

class batch_test
: public scratch_test
{
protected:

  runner_config_t config ;

  void SetUp() override
  {
    scratch_test::SetUp() ;
    config.engine = mock_engine() ;
    config.probe = std::make_shared < fake_probe_t >() ;
  }

  // a fresh input directory holding the given source files

  std::string make_input ( const std::string & name ,
                           const std::vector < std::string > & files )
  {
    std::string d = path ( name ) ;
    std::string err ;
    EXPECT_TRUE ( OIIO::Filesystem::create_directory ( d , err ) ) << err ;
    for ( const auto & f : files )
      write_file ( name + "/" + f , eac_source ) ;
    return d ;
  }

  const job_result_t * result_for ( const batch_report_t & report ,
                                    const std::string & file )
  {
    for ( const auto & r : report.results )
      if ( OIIO::Filesystem::filename ( r.source ) == file )
        return &r ;
    return nullptr ;
  }
} ;

TEST_F ( batch_test , finds_360_files_sorted )
{
  std::string in = make_input ( "in" , { "b.360" , "a.360" , "C.360" ,
                                         "notes.txt" , "d.360.bak" } ) ;
  std::string err ;
  OIIO::Filesystem::create_directory ( in + "/sub.360" , err ) ;
  write_file ( "in/sub.360/e.360" , eac_source ) ;

  auto files = find_input_files ( in ) ;

  ASSERT_EQ ( files.size() , 3u ) ;
  EXPECT_EQ ( OIIO::Filesystem::filename ( files[0] ) , "C.360" ) ;
  EXPECT_EQ ( OIIO::Filesystem::filename ( files[1] ) , "a.360" ) ;
  EXPECT_EQ ( OIIO::Filesystem::filename ( files[2] ) , "b.360" ) ;
}

TEST ( batch_naming , destinations )
{
  EXPECT_EQ ( destination_for ( "/in/clip.360" , "/out" , false ) ,
              "/out/clip_fisheye.mp4" ) ;
  EXPECT_EQ ( destination_for ( "/in/clip.360" , "/out/" , true ) ,
              "/out/clip_fisheye_masked.mp4" ) ;
  EXPECT_EQ ( destination_for ( "/in/GS010042.360" , "out" , false ) ,
              "out/GS010042_fisheye.mp4" ) ;

  EXPECT_EQ ( masked_destination_for ( "/v/clip.mp4" , false ) ,
              "/v/clip_masked.mp4" ) ;
  EXPECT_EQ ( masked_destination_for ( "/v/clip.mp4" , true ) ,
              "/v/clip_test_masked.mp4" ) ;
  EXPECT_EQ ( masked_destination_for ( "clip.mp4" , false ) ,
              "clip_masked.mp4" ) ;
}

TEST ( batch_naming , recognises_360_extension )
{
  EXPECT_TRUE ( has_360_extension ( "clip.360" ) ) ;
  EXPECT_TRUE ( has_360_extension ( "/in/GS010042.360" ) ) ;
  EXPECT_TRUE ( has_360_extension ( "CLIP.360" ) ) ;
  EXPECT_FALSE ( has_360_extension ( "clip.mp4" ) ) ;
  EXPECT_FALSE ( has_360_extension ( "clip.360.bak" ) ) ;
  EXPECT_FALSE ( has_360_extension ( "clip360" ) ) ;
}

TEST ( batch_workers , counts )
{
  int d = default_worker_count() ;
  EXPECT_GE ( d , 1 ) ;
  EXPECT_LE ( d , default_worker_cap ) ;

  EXPECT_EQ ( effective_worker_count ( 0 ) , d ) ;
  EXPECT_EQ ( effective_worker_count ( 1 ) , 1 ) ;
  EXPECT_EQ ( effective_worker_count ( 8 ) , 8 ) ;
  EXPECT_EQ ( effective_worker_count ( 20 ) , max_workers ) ;
  EXPECT_EQ ( thrown_kind ( [] { effective_worker_count ( -1 ) ; } ) ,
              INVALID_SPEC ) ;
}

TEST ( batch_retry , retryable_kinds )
{
  EXPECT_TRUE ( is_retryable ( ENGINE_FAILED ) ) ;
  EXPECT_TRUE ( is_retryable ( TIMEOUT ) ) ;
  EXPECT_TRUE ( is_retryable ( OUTPUT_VALIDATION_FAILED ) ) ;
  EXPECT_FALSE ( is_retryable ( SOURCE_NOT_FOUND ) ) ;
  EXPECT_FALSE ( is_retryable ( INVALID_SPEC ) ) ;
  EXPECT_FALSE ( is_retryable ( CANCELLED ) ) ;
}

TEST_F ( batch_test , every_job_reported_for_any_worker_count )
{
  for ( int n = 1 ; n <= 4 ; n++ )
  {
    for ( int k = 1 ; k <= n ; k++ )
    {
      std::string tag = std::to_string ( n ) + "_" + std::to_string ( k ) ;
      std::vector < std::string > files ;
      for ( int i = 0 ; i < n ; i++ )
        files.push_back ( "clip" + std::to_string ( i ) + ".360" ) ;

      std::string in = make_input ( "in_" + tag , files ) ;
      std::string out = path ( "out_" + tag ) ;

      // callbacks may overlap: each one sees its own snapshot

      std::mutex seen_mutex ;
      std::vector < std::size_t > seen ;
      batch_scheduler scheduler ( config ) ;
      scheduler.on_progress
        ( [&] ( const job_result_t & , const batch_report_t & report )
          {
            std::lock_guard < std::mutex > lock ( seen_mutex ) ;
            EXPECT_EQ (   report.succeeded + report.failed
                        + report.cancelled ,
                        report.results.size() ) ;
            seen.push_back ( report.results.size() ) ;
          } ) ;

      auto report = scheduler.run_batch ( in , out ,
                                          profile_by_name ( "fast" ) ,
                                          false , k ) ;

      EXPECT_EQ ( report.total , std::size_t ( n ) ) << tag ;
      EXPECT_EQ ( report.succeeded , std::size_t ( n ) ) << tag ;
      EXPECT_EQ ( report.failed , 0u ) << tag ;
      EXPECT_EQ ( report.cancelled , 0u ) << tag ;
      EXPECT_EQ ( report.results.size() , std::size_t ( n ) ) << tag ;
      EXPECT_TRUE ( report.all_succeeded() ) ;
      EXPECT_FALSE ( report.completed_with_failures() ) ;

      // one callback per job, each after one more result was recorded

      std::sort ( seen.begin() , seen.end() ) ;
      std::vector < std::size_t > expected ;
      for ( int i = 1 ; i <= n ; i++ )
        expected.push_back ( std::size_t ( i ) ) ;
      EXPECT_EQ ( seen , expected ) << tag ;

      for ( const auto & f : files )
        EXPECT_TRUE ( OIIO::Filesystem::exists
                        ( destination_for ( f , out , false ) ) ) << f ;
    }
  }
}

TEST_F ( batch_test , failures_counted_for_any_worker_count )
{
  // no jobs at all

  for ( int w = 1 ; w <= 2 ; w++ )
  {
    batch_scheduler scheduler ( config ) ;
    auto report = scheduler.run_jobs ( {} , w ) ;
    EXPECT_EQ ( report.total , 0u ) ;
    EXPECT_EQ ( report.succeeded + report.failed , 0u ) ;
    EXPECT_TRUE ( report.results.empty() ) ;
  }

  // n files of which k fail, either in the engine or in validation

  for ( int n = 1 ; n <= 4 ; n++ )
  {
    for ( int k = 0 ; k <= n ; k++ )
    {
      std::vector < std::string > files ;
      for ( int i = 0 ; i < n ; i++ )
      {
        std::string base ;
        if ( i >= k )
          base = "clip_" ;
        else if ( i % 2 == 0 )
          base = "fail_engine_" ;
        else
          base = "bad_dims_" ;
        files.push_back ( base + std::to_string ( i ) + ".360" ) ;
      }

      for ( int w = 1 ; w <= n ; w++ )
      {
        std::string tag =   std::to_string ( n ) + "_" + std::to_string ( k )
                          + "_" + std::to_string ( w ) ;
        std::string in = make_input ( "mixed_" + tag , files ) ;

        batch_scheduler scheduler ( config ) ;
        auto report = scheduler.run_batch ( in , path ( "out_" + tag ) ,
                                            profile_by_name ( "fast" ) ,
                                            false , w ) ;

        EXPECT_EQ ( report.total , std::size_t ( n ) ) << tag ;
        EXPECT_EQ ( report.succeeded + report.failed , std::size_t ( n ) )
          << tag ;
        EXPECT_EQ ( report.failed , std::size_t ( k ) ) << tag ;
        EXPECT_EQ ( report.succeeded , std::size_t ( n - k ) ) << tag ;
        EXPECT_EQ ( report.cancelled , 0u ) << tag ;
        EXPECT_EQ ( report.results.size() , std::size_t ( n ) ) << tag ;
        EXPECT_EQ ( report.completed_with_failures() , k > 0 ) << tag ;

        for ( const auto & r : report.results )
        {
          std::string name = OIIO::Filesystem::filename ( r.source ) ;
          if ( name.find ( "fail_engine_" ) == 0 )
            EXPECT_EQ ( r.error_kind , ENGINE_FAILED ) << tag << " " << name ;
          else if ( name.find ( "bad_dims_" ) == 0 )
            EXPECT_EQ ( r.error_kind , OUTPUT_VALIDATION_FAILED )
              << tag << " " << name ;
          else
            EXPECT_TRUE ( r.succeeded() ) << tag << " " << name ;
        }
      }
    }
  }
}

TEST_F ( batch_test , slow_callback_does_not_hold_up_other_jobs )
{
  std::string in = make_input ( "in" , { "a.360" , "b.360" } ) ;

  // the first callback waits until the second one has arrived, which
  // can only happen if the other worker records its job meanwhile

  std::mutex m ;
  std::condition_variable cv ;
  int arrived = 0 ;
  int met = 0 ;

  batch_scheduler scheduler ( config ) ;
  scheduler.on_progress
    ( [&] ( const job_result_t & , const batch_report_t & )
      {
        std::unique_lock < std::mutex > lock ( m ) ;
        ++arrived ;
        cv.notify_all() ;
        if ( cv.wait_for ( lock , std::chrono::seconds ( 10 ) ,
                           [&] { return arrived == 2 ; } ) )
          ++met ;
      } ) ;

  auto report = scheduler.run_batch ( in , path ( "out" ) ,
                                      profile_by_name ( "fast" ) ,
                                      false , 2 ) ;

  EXPECT_EQ ( report.succeeded , 2u ) ;
  EXPECT_EQ ( arrived , 2 ) ;
  EXPECT_EQ ( met , 2 ) ;
  EXPECT_LT ( report.elapsed , 10.0 ) ;
}

TEST_F ( batch_test , creates_nested_output_directory )
{
  std::string in = make_input ( "in" , { "clip.360" } ) ;
  std::string out = path ( "out/nested/deeper" ) ;

  batch_scheduler scheduler ( config ) ;
  auto report = scheduler.run_batch ( in , out ,
                                      profile_by_name ( "fast" ) ,
                                      false , 1 ) ;

  EXPECT_EQ ( report.succeeded , 1u ) ;
  EXPECT_TRUE ( OIIO::Filesystem::is_directory ( out ) ) ;
  EXPECT_TRUE ( OIIO::Filesystem::exists ( out + "/clip_fisheye.mp4" ) ) ;
}

TEST_F ( batch_test , output_directory_blocked_by_file )
{
  std::string in = make_input ( "in" , { "clip.360" } ) ;
  write_file ( "blocker" , "not a directory" ) ;

  batch_scheduler scheduler ( config ) ;
  EXPECT_EQ ( thrown_kind ( [&] {
                scheduler.run_batch ( in , path ( "blocker/out" ) ,
                                      profile_by_name ( "fast" ) ,
                                      false , 1 ) ; } ) ,
              IO_FAILED ) ;
  EXPECT_EQ ( engine_calls() , 0 ) ;
}

TEST_F ( batch_test , one_bad_file_does_not_stop_the_batch )
{
  std::string in = make_input ( "in" , { "a.360" , "bad_dims.360" , "c.360" } ) ;

  batch_scheduler scheduler ( config ) ;
  auto report = scheduler.run_batch ( in , path ( "out" ) ,
                                      profile_by_name ( "fast" ) ,
                                      false , 2 ) ;

  EXPECT_EQ ( report.total , 3u ) ;
  EXPECT_EQ ( report.succeeded , 2u ) ;
  EXPECT_EQ ( report.failed , 1u ) ;
  EXPECT_TRUE ( report.completed_with_failures() ) ;
  EXPECT_FALSE ( report.all_succeeded() ) ;

  auto bad = result_for ( report , "bad_dims.360" ) ;
  ASSERT_NE ( bad , nullptr ) ;
  EXPECT_EQ ( bad->error_kind , OUTPUT_VALIDATION_FAILED ) ;

  std::ostringstream summary ;
  summary << report ;
  EXPECT_NE ( summary.str().find ( "Successful: 2" ) , std::string::npos ) ;
  EXPECT_NE ( summary.str().find ( "Failed: 1" ) , std::string::npos ) ;
  EXPECT_NE ( summary.str().find ( "Failed files:" ) , std::string::npos ) ;
  EXPECT_NE ( summary.str().find ( "bad_dims.360: OutputValidationFailed" ) ,
              std::string::npos ) ;
}

TEST_F ( batch_test , masking_batch )
{
  std::string in = make_input ( "in" , { "clip.360" } ) ;
  std::string out = path ( "out" ) ;

  batch_options_t options ;
  options.masking = true ;
  options.workers = 1 ;

  batch_scheduler scheduler ( config ) ;
  auto report = scheduler.run_batch ( in , out , options ) ;

  EXPECT_EQ ( report.succeeded , 1u ) ;
  EXPECT_EQ ( engine_calls() , 2 ) ;
  EXPECT_TRUE ( OIIO::Filesystem::exists ( out + "/clip_fisheye_masked.mp4" ) ) ;
}

TEST_F ( batch_test , cancel_terminates_running_jobs )
{
  std::string in = make_input ( "in" , { "a_hang.360" , "b_slow.360" ,
                                         "c.360" } ) ;
  std::string pid_file = path ( "hang.pid" ) ;

  // cancel once b_slow is done and the hanging engine has announced
  // itself

  batch_scheduler scheduler ( config ) ;
  scheduler.on_progress
    ( [&] ( const job_result_t & , const batch_report_t & )
      {
        for ( int i = 0 ; i < 500 && read_file ( pid_file ).empty() ; i++ )
          std::this_thread::sleep_for ( std::chrono::milliseconds ( 20 ) ) ;
        scheduler.cancel() ;
      } ) ;

  auto report = scheduler.run_batch ( in , path ( "out" ) ,
                                      profile_by_name ( "fast" ) ,
                                      false , 2 ) ;

  EXPECT_TRUE ( scheduler.cancelled() ) ;
  EXPECT_EQ ( report.total , 3u ) ;
  EXPECT_EQ ( report.results.size() , 3u ) ;
  EXPECT_EQ ( report.succeeded , 1u ) ;
  EXPECT_EQ ( report.failed , 0u ) ;
  EXPECT_EQ ( report.cancelled , 2u ) ;
  EXPECT_LT ( report.elapsed , 20.0 ) ;

  auto a = result_for ( report , "a_hang.360" ) ;
  ASSERT_NE ( a , nullptr ) ;
  EXPECT_EQ ( a->status , JOB_CANCELLED ) ;
  EXPECT_EQ ( a->attempts , 1 ) ;

  auto b = result_for ( report , "b_slow.360" ) ;
  ASSERT_NE ( b , nullptr ) ;
  EXPECT_TRUE ( b->succeeded() ) ;

  auto c = result_for ( report , "c.360" ) ;
  ASSERT_NE ( c , nullptr ) ;
  EXPECT_EQ ( c->status , JOB_CANCELLED ) ;
  EXPECT_EQ ( c->attempts , 0 ) ;

  // the engine which was running is gone

  std::string pid_text = read_file ( pid_file ) ;
  ASSERT_FALSE ( pid_text.empty() ) ;
  pid_t pid = pid_t ( std::stol ( pid_text ) ) ;
  EXPECT_EQ ( kill ( pid , 0 ) , -1 ) ;
  EXPECT_EQ ( errno , ESRCH ) ;
}

TEST_F ( batch_test , cancelled_before_run )
{
  std::vector < conversion_job_t > jobs ( 3 ) ;
  for ( int i = 0 ; i < 3 ; i++ )
  {
    jobs[i].source = write_file ( "s" + std::to_string ( i ) + ".360" ,
                                  eac_source ) ;
    jobs[i].destination = path ( "d" + std::to_string ( i ) + ".mp4" ) ;
  }

  batch_scheduler scheduler ( config ) ;
  scheduler.cancel() ;
  auto report = scheduler.run_jobs ( jobs , 2 ) ;

  EXPECT_EQ ( report.cancelled , 3u ) ;
  EXPECT_EQ ( report.results.size() , 3u ) ;
  EXPECT_EQ ( engine_calls() , 0 ) ;
}

TEST_F ( batch_test , retries_engine_failures )
{
  std::string in = make_input ( "in" , { "fail_engine.360" } ) ;

  batch_options_t options ;
  options.workers = 1 ;
  options.retries = 2 ;

  batch_scheduler scheduler ( config ) ;
  auto report = scheduler.run_batch ( in , path ( "out" ) , options ) ;

  ASSERT_EQ ( report.results.size() , 1u ) ;
  EXPECT_EQ ( report.failed , 1u ) ;
  EXPECT_EQ ( report.results[0].error_kind , ENGINE_FAILED ) ;
  EXPECT_EQ ( report.results[0].attempts , 3 ) ;
  EXPECT_EQ ( engine_calls() , 3 ) ;
}

TEST_F ( batch_test , no_retry_for_bad_input )
{
  std::string in = make_input ( "in" , { } ) ;
  write_file ( "in/empty.360" , "" ) ;

  batch_options_t options ;
  options.workers = 1 ;
  options.retries = 2 ;

  batch_scheduler scheduler ( config ) ;
  auto report = scheduler.run_batch ( in , path ( "out" ) , options ) ;

  ASSERT_EQ ( report.results.size() , 1u ) ;
  EXPECT_EQ ( report.results[0].error_kind , SOURCE_NOT_FOUND ) ;
  EXPECT_EQ ( report.results[0].attempts , 1 ) ;
  EXPECT_EQ ( engine_calls() , 0 ) ;
}

TEST_F ( batch_test , failing_callback_is_contained )
{
  std::string in = make_input ( "in" , { "a.360" , "b.360" } ) ;

  batch_scheduler scheduler ( config ) ;
  scheduler.on_progress
    ( [] ( const job_result_t & , const batch_report_t & )
      {
        throw std::runtime_error ( "display went away" ) ;
      } ) ;

  auto report = scheduler.run_batch ( in , path ( "out" ) ,
                                      profile_by_name ( "fast" ) ,
                                      false , 2 ) ;

  EXPECT_EQ ( report.succeeded , 2u ) ;
}

TEST_F ( batch_test , nothing_to_do )
{
  std::string in = make_input ( "in" , { "readme.txt" } ) ;
  batch_scheduler scheduler ( config ) ;

  EXPECT_EQ ( thrown_kind ( [&]
                { scheduler.run_batch ( in , path ( "out" ) ,
                                        profile_by_name ( "fast" ) ,
                                        false , 1 ) ; } ) ,
              NO_INPUT_FILES ) ;

  EXPECT_EQ ( thrown_kind ( [&]
                { scheduler.run_batch ( path ( "missing" ) , path ( "out" ) ,
                                        profile_by_name ( "fast" ) ,
                                        false , 1 ) ; } ) ,
              INVALID_SPEC ) ;

  EXPECT_EQ ( thrown_kind ( [&]
                { scheduler.run_jobs ( { } , 0 ) ; } ) ,
              INVALID_SPEC ) ;
}

TEST_F ( batch_test , empty_job_list )
{
  batch_scheduler scheduler ( config ) ;
  auto report = scheduler.run_jobs ( { } , 2 ) ;

  EXPECT_EQ ( report.total , 0u ) ;
  EXPECT_TRUE ( report.results.empty() ) ;
  EXPECT_TRUE ( report.all_succeeded() ) ;
}
