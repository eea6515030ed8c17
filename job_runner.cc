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

#include <sstream>

#include <OpenImageIO/filesystem.h>
#include <OpenImageIO/strutil.h>

#include "job_runner.h"
#include "lrvutil_log.h"
#include "masking.h"
#include "subprocess.h"

namespace lrvutil
{

using OIIO::Strutil::fmt::format ;

namespace
{
  // a file which is removed when the object goes out of scope. The file
  // itself is created by whoever writes to 'path'.

  class scoped_temp_file
  {
    std::string file_path ;

  public:

    explicit scoped_temp_file ( const std::string & _path )
    : file_path ( _path )
    { }

    ~scoped_temp_file()
    {
      if ( OIIO::Filesystem::exists ( file_path ) )
      {
        std::string err ;
        if ( ! OIIO::Filesystem::remove ( file_path , err ) )
          log_warning ( "can't remove " + file_path + ": " + err ) ;
      }
    }

    scoped_temp_file ( const scoped_temp_file & ) = delete ;
    scoped_temp_file & operator= ( const scoped_temp_file & ) = delete ;

    const std::string & path() const
    {
      return file_path ;
    }
  } ;

  bool non_empty_file ( const std::string & path )
  {
    return    OIIO::Filesystem::is_regular ( path )
           && OIIO::Filesystem::file_size ( path ) > 0 ;
  }

  std::string size_str ( int width , int height )
  {
    return std::to_string ( width ) + "x" + std::to_string ( height ) ;
  }

  // the projected frames of a job with masking are parked next to the
  // destination, as temp_<destination file name>

  std::string intermediate_path ( const std::string & destination )
  {
    std::string dir = OIIO::Filesystem::parent_path ( destination ) ;
    std::string name = "temp_" + OIIO::Filesystem::filename ( destination ) ;
    return dir.empty() ? name : dir + "/" + name ;
  }

  std::string join ( const std::vector < std::string > & parts ,
                     const std::string & separator )
  {
    std::string result ;
    for ( const auto & p : parts )
    {
      if ( ! result.empty() )
        result += separator ;
      result += p ;
    }
    return result ;
  }
} ;

std::ostream & operator<< ( std::ostream & osr , const job_result_t & r )
{
  std::string src = OIIO::Filesystem::filename ( r.source ) ;

  switch ( r.status )
  {
    case JOB_SUCCEEDED:
      osr << "✅ " << src << " → "
          << OIIO::Filesystem::filename ( r.destination )
          << format ( " ({:.1f}MB, {:.1f}s)" ,
                      r.output_size / ( 1024.0 * 1024.0 ) ,
                      r.elapsed ) ;
      if ( r.attempts > 1 )
        osr << " after " << r.attempts << " attempts" ;
      break ;
    case JOB_FAILED:
      osr << "❌ " << src << ": " << error_kind_name [ r.error_kind ]
          << ": " << r.error_detail ;
      break ;
    case JOB_CANCELLED:
      osr << "⏹  " << src << ": cancelled" ;
      break ;
  }
  return osr ;
}

job_runner::job_runner ( runner_config_t config )
: cfg ( config )
{
  if ( ! cfg.probe )
    cfg.probe = std::make_shared < libav_probe_t >() ;
}

void job_runner::invoke ( const command_spec_t & cmd ,
                          const std::string & output ,
                          const cancel_token_t * cancel ) const
{
  auto argv = cmd.argv ( cfg.engine , output ) ;
  log_debug ( "engine command: " + display_command ( argv ) ) ;

  auto start = LRVUTIL_NOW() ;

  scoped_process engine ( argv ) ;
  auto outcome = engine.wait ( cfg.timeout , cancel ) ;

  log_debug ( format ( "engine pass took {:.1f}s" ,
                       seconds_between ( start , LRVUTIL_NOW() ) ) ) ;

  switch ( outcome.status )
  {
    case PROCESS_TIMED_OUT:
      throw error ( TIMEOUT ,
                    format ( "engine terminated after {}s" , cfg.timeout ) ) ;
    case PROCESS_CANCELLED:
      throw error ( CANCELLED , "engine terminated on cancellation" ) ;
    case PROCESS_EXITED:
      break ;
  }

  if ( outcome.exit_code != 0 )
  {
    std::string detail = "engine exited with code "
                         + std::to_string ( outcome.exit_code ) ;
    if ( ! outcome.stderr_tail.empty() )
      detail += ":\n" + outcome.stderr_tail ;
    throw error ( ENGINE_FAILED , detail ) ;
  }
}

void job_runner::mask_pass ( const std::string & source ,
                             const std::string & output ,
                             const v2i_t & size ,
                             const conversion_job_t & job ,
                             const cancel_token_t * cancel ) const
{
  auto mask = generate_mask ( size.x , size.y ) ;

  scoped_temp_file mask_file
    ( OIIO::Filesystem::unique_path
        (   OIIO::Filesystem::temp_directory_path()
          + "/lrvutil_mask_" + size_str ( size.x , size.y )
          + "_%%%%%%%%.png" ) ) ;

  save_mask ( mask , mask_file.path() ) ;

  auto mspec = make_mask_spec ( size.x , size.y ) ;
  log_debug ( format ( "mask {}: radius {}, centres ({},{}) ({},{})" ,
                       mask_file.path() , mspec.radius ,
                       mspec.left_center.x , mspec.left_center.y ,
                       mspec.right_center.x , mspec.right_center.y ) ) ;

  auto cmd = build_masking_chain ( source , mask_file.path() , mask ,
                                   job.profile , job.duration_limit ) ;
  invoke ( cmd , output , cancel ) ;
}

std::vector < std::string > job_runner::validate_output
  ( const std::string & output ,
    const v2i_t & expected_size ,
    bool expect_audio ,
    std::uintmax_t & output_size ) const
{
  std::vector < std::string > findings ;

  if ( ! OIIO::Filesystem::is_regular ( output ) )
  {
    findings.push_back ( "output file missing" ) ;
    return findings ;
  }

  output_size = OIIO::Filesystem::file_size ( output ) ;
  if ( output_size == 0 )
  {
    findings.push_back ( "output file is empty" ) ;
    return findings ;
  }

  auto info = cfg.probe->probe ( output ) ;
  if ( ! info.valid )
  {
    findings.push_back ( "can't inspect output: " + info.error ) ;
    return findings ;
  }

  if ( ! info.has_video )
  {
    findings.push_back ( "output has no video stream" ) ;
  }
  else if (    info.width != expected_size.x
            || info.height != expected_size.y )
  {
    findings.push_back ( "frame size " + size_str ( info.width , info.height )
                         + ", expected "
                         + size_str ( expected_size.x , expected_size.y ) ) ;
  }

  if ( expect_audio && ! info.has_audio )
    findings.push_back ( "source has audio, output has none" ) ;

  return findings ;
}

void create_directories ( const std::string & dir )
{
  if ( dir.empty() || OIIO::Filesystem::is_directory ( dir ) )
    return ;

  create_directories ( OIIO::Filesystem::parent_path ( dir ) ) ;

  // another worker may have created it in the meantime

  std::string err ;
  if (    ! OIIO::Filesystem::create_directory ( dir , err )
       && ! OIIO::Filesystem::is_directory ( dir ) )
  {
    throw error ( IO_FAILED ,
                  "can't create directory " + dir + ": " + err ) ;
  }
}

job_result_t job_runner::run ( const conversion_job_t & job ,
                               const cancel_token_t * cancel ) const
{
  job_result_t result ;
  result.source = job.source ;
  result.destination = job.destination ;

  auto start = LRVUTIL_NOW() ;

  // set once the engine may have written to the destination

  bool destination_touched = false ;

  try
  {
    if ( ! non_empty_file ( job.source ) )
    {
      throw error ( SOURCE_NOT_FOUND ,
                    "source missing or empty: " + job.source ) ;
    }

    if ( job.duration_limit < 0.0 )
    {
      throw error ( INVALID_SPEC ,
                    format ( "negative duration limit {}" ,
                             job.duration_limit ) ) ;
    }

    validate ( job.profile ) ;

    if ( cancel && cancel->cancelled() )
      throw error ( CANCELLED , "cancelled before start" ) ;

    create_directories ( OIIO::Filesystem::parent_path ( job.destination ) ) ;

    auto source_info = cfg.probe->probe ( job.source ) ;
    if ( source_info.valid )
    {
      std::ostringstream osr ;
      osr << job.source << ": " << source_info ;
      log_debug ( osr.str() ) ;
    }
    else
    {
      log_warning ( "can't inspect " + job.source + " ("
                    + source_info.error + "), skipping the audio check" ) ;
    }

    bool expect_audio = source_info.valid && source_info.has_audio ;
    v2i_t expected_size ;

    if ( job.mask_only )
    {
      if ( ! source_info.valid || ! source_info.has_video )
      {
        throw error ( INVALID_SPEC ,
                      "can't determine the frame size of " + job.source ) ;
      }

      expected_size = v2i_t ( source_info.width , source_info.height ) ;

      double aspect = double ( source_info.width ) / source_info.height ;
      if ( aspect < 1.8 || aspect > 2.2 )
      {
        log_warning ( format ( "{}: aspect ratio {:.2f} ({}) is not the "
                               "~2:1 of dual fisheye" ,
                               job.source , aspect ,
                               size_str ( source_info.width ,
                                          source_info.height ) ) ) ;
      }

      destination_touched = true ;
      mask_pass ( job.source , job.destination , expected_size ,
                  job , cancel ) ;
    }
    else
    {
      projection_spec_t spec ( job.projection ) ;
      if ( source_info.valid )
      {
        spec.input_width = source_info.width ;
        spec.input_height = source_info.height ;
      }

      auto cmd = build_projection_chain ( job.source , spec , job.profile ) ;
      expected_size = v2i_t ( spec.output_width , spec.output_height ) ;

      if ( job.masking )
      {
        // the mask goes on the projected frames, not the cubemap, so
        // this takes two engine passes

        scoped_temp_file intermediate ( intermediate_path ( job.destination ) ) ;
        invoke ( cmd , intermediate.path() , cancel ) ;

        if ( ! non_empty_file ( intermediate.path() ) )
        {
          throw error ( OUTPUT_VALIDATION_FAILED ,
                        "projection pass produced no output" ) ;
        }

        destination_touched = true ;
        mask_pass ( intermediate.path() , job.destination , expected_size ,
                    job , cancel ) ;
      }
      else
      {
        destination_touched = true ;
        invoke ( cmd , job.destination , cancel ) ;
      }
    }

    result.findings = validate_output ( job.destination , expected_size ,
                                        expect_audio , result.output_size ) ;

    if ( result.findings.empty() )
    {
      result.status = JOB_SUCCEEDED ;
    }
    else
    {
      result.status = JOB_FAILED ;
      result.error_kind = OUTPUT_VALIDATION_FAILED ;
      result.error_detail = join ( result.findings , "; " ) ;
    }
  }
  catch ( const error & e )
  {
    result.status = ( e.kind == CANCELLED ) ? JOB_CANCELLED : JOB_FAILED ;
    result.error_kind = e.kind ;
    result.error_detail = e.what() ;

    // a broken or half-written output is not left behind

    if (    destination_touched
         && ( e.kind == ENGINE_FAILED || e.kind == TIMEOUT
              || e.kind == CANCELLED )
         && OIIO::Filesystem::exists ( job.destination ) )
    {
      std::string err ;
      if ( ! OIIO::Filesystem::remove ( job.destination , err ) )
        log_warning ( "can't remove " + job.destination + ": " + err ) ;
    }
  }
  catch ( const std::exception & e )
  {
    result.status = JOB_FAILED ;
    result.error_kind = ENGINE_FAILED ;
    result.error_detail = std::string ( "unexpected failure: " ) + e.what() ;
  }

  result.elapsed = seconds_between ( start , LRVUTIL_NOW() ) ;
  return result ;
}

} ; // namespace lrvutil
