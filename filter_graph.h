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

// filter graph construction. lrvutil does no pixel work itself: the
// projection from EAC to dual fisheye and the masking composite are
// both expressed as one filter graph for the external engine (ffmpeg)
// and run in a single invocation each, so intermediate frames never
// touch the disk. A command_spec_t holds the graph as a sequence of
// named stages plus the encoder flags; argv() renders the complete
// command line.

#ifndef LRVUTIL_FILTER_GRAPH_H
#define LRVUTIL_FILTER_GRAPH_H

#include <string>
#include <vector>

#include <OpenImageIO/imagebuf.h>

#include "lrvutil_basic.h"

namespace lrvutil
{

// one stage of a filter graph: a chain of filters reading the labelled
// pads 'inputs' and producing the labelled pads 'outputs'. A source
// stage (like 'color') has no inputs.

struct filter_stage_t
{
  std::string name ;
  std::vector < std::string > inputs ;
  std::string filter ;
  std::vector < std::string > outputs ;

  // the stage in the engine's notation: [in]...filter[out]...

  std::string str() const ;
} ;

struct command_spec_t
{
  // input files, in the order of their '-i' arguments

  std::vector < std::string > inputs ;

  std::vector < filter_stage_t > stages ;

  // the pad which goes to the output file

  std::string final_label ;

  // video encoder flags; audio is always stream-copied

  std::vector < std::string > encoder_flags ;

  // if positive, only this many seconds of the input are processed

  double duration_limit = 0.0 ;

  // the frame size the output must have

  int output_width = 0 ;
  int output_height = 0 ;

  // all stages joined into one -filter_complex argument

  std::string filter_complex() const ;

  // the stage with the given name, or nullptr

  const filter_stage_t * stage ( const std::string & name ) const ;

  // full argument vector, starting with the engine executable

  std::vector < std::string > argv ( const std::string & engine ,
                                     const std::string & output ) const ;
} ;

// EAC -> equirect -> two fisheye eyes -> side by side. The stages are
// 'equirect', 'left_eye', 'right_eye' and 'dual_fisheye'. Throws
// INVALID_SPEC for a bad spec or profile.

command_spec_t build_projection_chain ( const std::string & source ,
                                        const projection_spec_t & spec ,
                                        const encoding_profile_t & profile ) ;

// merge the mask (stored in mask_file, with the content of 'mask') into
// the source as alpha and composite over opaque black of the same size.
// The stages are 'mask', 'masked', 'background' and 'final'. Throws
// INVALID_DIMENSIONS for an empty mask, INVALID_SPEC for a bad profile
// or a negative duration_limit.

command_spec_t build_masking_chain ( const std::string & source ,
                                     const std::string & mask_file ,
                                     const OIIO::ImageBuf & mask ,
                                     const encoding_profile_t & profile ,
                                     double duration_limit = 0.0 ) ;

// encoder flags for the video stream

std::vector < std::string > encoder_flags
  ( const encoding_profile_t & profile ) ;

// a command line joined for display, with arguments containing blanks
// or filter syntax quoted

std::string display_command ( const std::vector < std::string > & argv ) ;

} ; // namespace lrvutil

#endif // LRVUTIL_FILTER_GRAPH_H
