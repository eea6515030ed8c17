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

// this header has the basic enums and value types used throughout
// lrvutil: the projections we ask the engine to map between, the error
// taxonomy, the projection parameters and the encoding profiles. None
// of this depends on OIIO or the engine.

#ifndef LRVUTIL_BASIC_H
#define LRVUTIL_BASIC_H

#include <string>
#include <stdexcept>
#include <iostream>

namespace lrvutil
{

// projections which occur in a conversion. The names are the tokens
// the engine's v360 filter uses for them, so they can go straight
// into a filter graph.

typedef enum
{
  EAC ,
  EQUIRECT ,
  FISHEYE
}  projection_t ;

const char * const projection_name[]
{
  "eac" ,
  "e" ,
  "fisheye"
} ;

// kinds of failure. Parameter and pre-flight errors are thrown as
// lrvutil::error before the engine is started, everything else ends
// up in a job_result_t.

typedef enum
{
  INVALID_DIMENSIONS ,
  INVALID_SPEC ,
  SOURCE_NOT_FOUND ,
  ENGINE_FAILED ,
  OUTPUT_VALIDATION_FAILED ,
  TIMEOUT ,
  CANCELLED ,
  NO_INPUT_FILES ,
  IO_FAILED ,
  ERR_NONE
} error_kind_t ;

const char * const error_kind_name[]
{
  "InvalidDimensions" ,
  "InvalidSpec" ,
  "SourceNotFound" ,
  "EngineFailed" ,
  "OutputValidationFailed" ,
  "Timeout" ,
  "Cancelled" ,
  "NoInputFiles" ,
  "IoFailed" ,
  "None"
} ;

class error
: public std::runtime_error
{
public:

  const error_kind_t kind ;

  error ( error_kind_t _kind , const std::string & what )
  : std::runtime_error ( what ) ,
    kind ( _kind )
  { }
} ;

// the geometry of one conversion. The defaults are the 'LRV match'
// values: a 2:1 dual fisheye frame of 1408x704, each eye covering 190
// degrees, looking left and right from an intermediate 3840x1920
// equirect. input_width/input_height are informational, the output
// does not depend on them.

struct projection_spec_t
{
  int input_width = 0 ;
  int input_height = 0 ;

  int output_width = 1408 ;
  int output_height = 704 ;

  // both eyes share h_fov and v_fov, so they are symmetric by construction

  double h_fov = 190.0 ;
  double v_fov = 190.0 ;

  double left_yaw = -90.0 ;
  double right_yaw = 90.0 ;

  int equirect_width = 3840 ;
  int equirect_height = 1920 ;

  int eye_width() const
  {
    return output_width / 2 ;
  }

  int eye_height() const
  {
    return output_height ;
  }

  friend std::ostream & operator<<
    ( std::ostream & osr , const projection_spec_t & s )
  {
    osr << "prj { in " << s.input_width << "x" << s.input_height
        << " equirect " << s.equirect_width << "x" << s.equirect_height
        << " out " << s.output_width << "x" << s.output_height
        << " fov " << s.h_fov << "/" << s.v_fov
        << " yaw " << s.left_yaw << "/" << s.right_yaw << " }" ;
    return osr ;
  }
} ;

// the fixed geometry matching the camera's low-resolution preview

projection_spec_t lrv_match_spec ( int input_width = 0 ,
                                   int input_height = 0 ) ;

// a custom geometry. The output is two square eyes side by side, so
// the 2:1 aspect ratio is kept automatically, and the intermediate
// equirect is 2:1 as well. Throws INVALID_SPEC if the values are off.

projection_spec_t custom_spec ( int eye_size ,
                                double fov ,
                                int equirect_width ) ;

// throws lrvutil::error ( INVALID_SPEC ) if the values are outside sane
// bounds: fov in (0,360], positive and even sizes, 2:1 output and
// equirect, yaw in [-180,180] and mirrored between the eyes.

void validate ( const projection_spec_t & spec ) ;

// encoder speed preset and CRF. The two are independent: the profile
// names only pick a convenient pair.

struct encoding_profile_t
{
  std::string name = "balanced" ;
  std::string preset = "medium" ;
  int crf = 23 ;
} ;

extern const char * const encoder_preset_name[] ;
extern const int encoder_preset_count ;

const int crf_min = 0 ;
const int crf_max = 51 ;

// 'fast', 'balanced' or 'quality'. Throws INVALID_SPEC for other names.

encoding_profile_t profile_by_name ( const std::string & name ) ;

// a profile with explicit preset and CRF, named 'custom'

encoding_profile_t make_profile ( const std::string & preset , int crf ) ;

bool is_encoder_preset ( const std::string & preset ) ;

void validate ( const encoding_profile_t & profile ) ;

} ; // namespace lrvutil

#endif // LRVUTIL_BASIC_H
