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
#include <cmath>
#include <vector>

#include "lrvutil_basic.h"
#include "masking.h"

namespace lrvutil
{

mask_spec_t make_mask_spec ( int width , int height )
{
  if ( width <= 0 || height <= 0 )
  {
    throw error ( INVALID_DIMENSIONS ,
                  "invalid mask size " + std::to_string ( width )
                  + "x" + std::to_string ( height ) ) ;
  }

  mask_spec_t spec ;
  spec.size = v2i_t ( width , height ) ;
  spec.radius = int ( std::lround ( mask_radius_factor * height ) )
                + mask_padding ;
  spec.left_center = v2i_t ( width / 4 , height / 2 ) ;
  spec.right_center = v2i_t ( 3 * width / 4 , height / 2 ) ;
  return spec ;
}

// largest dx with dx * dx <= n, in integer arithmetic only so that the
// outline doesn't depend on floating point rounding

static int isqrt ( long n )
{
  long dx = long ( std::sqrt ( double ( n ) ) ) ;
  while ( dx * dx > n )
    --dx ;
  while ( ( dx + 1 ) * ( dx + 1 ) <= n )
    ++dx ;
  return int ( dx ) ;
}

void fill_circle ( const v2i_t & center ,
                   int radius ,
                   int left , int top ,
                   int right , int bottom ,
                   std::function < void ( int , int ) > fill_pixel )
{
  int y0 = std::max ( top , center.y - radius ) ;
  int y1 = std::min ( bottom , center.y + radius + 1 ) ;

  for ( int y = y0 ; y < y1 ; y++ )
  {
    long dy = y - center.y ;
    int dx = isqrt ( long ( radius ) * radius - dy * dy ) ;

    int x0 = std::max ( left , center.x - dx ) ;
    int x1 = std::min ( right , center.x + dx + 1 ) ;

    for ( int x = x0 ; x < x1 ; x++ )
      fill_pixel ( x , y ) ;
  }
}

OIIO::ImageBuf generate_mask ( int width , int height )
{
  auto spec = make_mask_spec ( width , height ) ;

  // paint into a plain byte array first, then hand the lot to OIIO

  std::vector < unsigned char > pixels ( std::size_t ( width ) * height , 0 ) ;

  auto paint = [&] ( int x , int y )
  {
    pixels [ std::size_t ( y ) * width + x ] = 255 ;
  } ;

  fill_circle ( spec.left_center , spec.radius ,
                0 , 0 , width , height , paint ) ;
  fill_circle ( spec.right_center , spec.radius ,
                0 , 0 , width , height , paint ) ;

  OIIO::ImageSpec ispec ( width , height , 1 , OIIO::TypeDesc::UINT8 ) ;
  ispec["ImageDescription"] = "dual fisheye mask made by lrvutil" ;

  OIIO::ImageBuf mask ( ispec ) ;

  if ( ! mask.set_pixels ( OIIO::ROI ( 0 , width , 0 , height , 0 , 1 , 0 , 1 ) ,
                           OIIO::TypeDesc::UINT8 ,
                           pixels.data() ) )
  {
    throw error ( IO_FAILED , "can't fill mask: " + mask.geterror() ) ;
  }

  return mask ;
}

void save_mask ( const OIIO::ImageBuf & mask ,
                 const std::string & filename )
{
  if ( ! mask.write ( filename ) )
  {
    throw error ( IO_FAILED ,
                  "can't write mask image " + filename + ": "
                  + mask.geterror() ) ;
  }
}

} ; // namespace lrvutil
