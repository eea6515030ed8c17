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

// the functions in this header create the 'mask' image which is used
// to black out everything outside the two fisheye circles of a dual
// fisheye frame. The mask is white (255) where the fisheye content is
// kept and black (0) elsewhere. The engine merges it into the video
// as alpha and composites the result over black, see filter_graph.h.
// The mask is a pure function of the frame size: both circles share
// one radius, 0.45 times the frame height (rounded) plus 20 pixels of
// padding, and sit at a quarter and three quarters of the width, on
// the horizontal centre line. Circles are hard-edged: a pixel is
// white if and only if its distance from a centre is at most the
// radius, so repeated calls produce identical images.

#ifndef LRVUTIL_MASKING_H
#define LRVUTIL_MASKING_H

#include <functional>
#include <string>

#include <OpenImageIO/imagebuf.h>

#include "common.h"

namespace lrvutil
{

const double mask_radius_factor = 0.45 ;
const int mask_padding = 20 ;

struct mask_spec_t
{
  v2i_t size ;
  int radius ;
  v2i_t left_center ;
  v2i_t right_center ;
} ;

// throws lrvutil::error ( INVALID_DIMENSIONS ) for non-positive sizes

mask_spec_t make_mask_spec ( int width , int height ) ;

// call fill_pixel for every pixel of a filled circle, clipped to
// [left,right) x [top,bottom). Rows are filled as spans, left to right.

void fill_circle ( const v2i_t & center ,
                   int radius ,
                   int left , int top ,
                   int right , int bottom ,
                   std::function < void ( int , int ) > fill_pixel ) ;

// single-channel UINT8 image with the two circles painted white.
// throws lrvutil::error ( INVALID_DIMENSIONS ) for non-positive sizes.

OIIO::ImageBuf generate_mask ( int width , int height ) ;

// store the mask as an image file the engine can read (e.g. PNG).
// throws lrvutil::error ( IO_FAILED ) if OIIO can't write it.

void save_mask ( const OIIO::ImageBuf & mask ,
                 const std::string & filename ) ;

} ; // namespace lrvutil

#endif // LRVUTIL_MASKING_H
